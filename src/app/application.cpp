// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "application.h"
#include "notesession.h"
#include "shortcutmanager.h"
#include "platform/overlaydriverfactory.h"
#include "../config/settings.h"
#include "../core/constants.h"
#include "../core/interfaces.h"
#include "../core/logging.h"
#include "../core/notestore.h"
#include "../core/overlaycontroller.h"
#include "../core/overlayenforcer.h"
#include "../core/overlayplacer.h"
#include "../core/overlaystatestore.h"
#include "../core/taskscheduler.h"
#include "../core/togglecoordinator.h"
#include "../dbus/notesadaptor.h"
#include "../dbus/overlayadaptor.h"
#include <QDBusConnection>
#include <QDBusError>
#include <QQmlComponent>
#include <QQmlContext>
#include <QQmlEngine>
#include <QQuickWindow>
#include <QUrl>
#include <KLocalizedContext>

namespace TopNote {

Application::Application(QObject* parent)
    : QObject(parent)
    , m_settings(std::make_unique<Settings>())
    , m_noteStore(std::make_unique<NoteStore>())
    , m_engine(std::make_unique<QQmlEngine>()) // No parent - unique_ptr manages lifetime
    , m_scheduler(std::make_unique<QtTaskScheduler>())
    , m_overlayState(std::make_unique<OverlayStateStore>())
    , m_enforcer(std::make_unique<OverlayEnforcer>())
{
    m_noteSession = std::make_unique<NoteSession>(m_noteStore.get());
    m_shortcutManager = std::make_unique<ShortcutManager>(m_settings.get());
}

Application::~Application()
{
    // Components hold raw pointers to the driver and the window
    m_shortcutManager.reset();
    m_overlayController.reset();
    m_toggleCoordinator.reset();
    m_placer.reset();
    m_driver.reset();
    m_panel.reset();
}

bool Application::init()
{
    m_settings->load();

    // A missing or unreadable note is not fatal: the panel starts empty
    if (!m_noteSession->load()) {
        qCWarning(lcApp) << "Starting with an empty note:" << m_noteSession->lastError();
    }

    if (!createPanel()) {
        return false;
    }

    m_driver = createOverlayDriver(m_panel.get());
    if (!m_driver) {
        qCCritical(lcApp) << "No overlay driver for this display server";
        return false;
    }

    const OperationResult converted = m_driver->convertToOverlayPanel();
    if (!converted) {
        qCCritical(lcApp) << "Failed to convert panel to overlay:" << converted.errorMessage;
        return false;
    }

    m_placer = std::make_unique<OverlayPlacer>(m_driver.get(), m_overlayState.get());
    m_placer->setMargins(m_settings->placementMarginX(), m_settings->placementMarginY());
    connect(m_settings.get(), &Settings::settingsChanged, this, [this]() {
        m_placer->setMargins(m_settings->placementMarginX(), m_settings->placementMarginY());
    });

    m_toggleCoordinator = std::make_unique<ToggleCoordinator>(m_driver.get(), m_overlayState.get(), m_enforcer.get(),
                                                              m_scheduler.get());
    m_toggleCoordinator->setPlacer(m_placer.get());

    m_overlayController =
        std::make_unique<OverlayController>(m_driver.get(), m_overlayState.get(), m_enforcer.get(), m_placer.get(),
                                            m_toggleCoordinator.get(), m_scheduler.get());
    m_engine->rootContext()->setContextProperty(QStringLiteral("overlayController"), m_overlayController.get());

    // Initial configuration; re-asserted on every show anyway
    const OperationResult enforced = m_enforcer->enforce(m_driver.get());
    if (!enforced) {
        qCWarning(lcApp) << "Initial overlay configuration incomplete:" << enforced.errorMessage;
    }

    connect(m_shortcutManager.get(), &ShortcutManager::toggleOverlayRequested, m_toggleCoordinator.get(),
            &ToggleCoordinator::onHotkeyTriggered);
    if (!m_shortcutManager->registerShortcuts()) {
        qCCritical(lcApp) << "Cannot run without the toggle shortcut";
        return false;
    }
    m_engine->rootContext()->setContextProperty(QStringLiteral("toggleShortcut"),
                                                m_shortcutManager->toggleOverlayShortcutText());
    connect(m_settings.get(), &Settings::toggleOverlayShortcutChanged, this, [this]() {
        m_engine->rootContext()->setContextProperty(QStringLiteral("toggleShortcut"),
                                                    m_shortcutManager->toggleOverlayShortcutText());
    });

    if (!registerDBus()) {
        return false;
    }

    qCInfo(lcApp) << "Initialized on" << m_driver->platformName();
    return true;
}

bool Application::createPanel()
{
    // Set up i18n for QML (makes i18n() available in QML)
    auto* localizedContext = new KLocalizedContext(m_engine.get());
    m_engine->rootContext()->setContextObject(localizedContext);
    m_engine->rootContext()->setContextProperty(QStringLiteral("noteSession"), m_noteSession.get());
    m_engine->rootContext()->setContextProperty(QStringLiteral("toggleShortcut"),
                                                m_settings->toggleOverlayShortcut());

    QQmlComponent component(m_engine.get(), QUrl(QStringLiteral("qrc:/topnote/NotePanel.qml")));
    if (component.isError()) {
        qCCritical(lcApp) << "Failed to load panel QML:" << component.errors();
        return false;
    }

    QObject* obj = component.create();
    if (!obj) {
        qCCritical(lcApp) << "Failed to create panel window:" << component.errors();
        return false;
    }

    auto* window = qobject_cast<QQuickWindow*>(obj);
    if (!window) {
        qCCritical(lcApp) << "Panel root object is not a QQuickWindow";
        delete obj;
        return false;
    }

    // Take C++ ownership so QML's GC doesn't delete the window
    QQmlEngine::setObjectOwnership(window, QQmlEngine::CppOwnership);
    m_panel.reset(window);
    return true;
}

bool Application::registerDBus()
{
    m_overlayAdaptor = new OverlayAdaptor(m_overlayController.get(), this);
    m_notesAdaptor = new NotesAdaptor(m_noteSession.get(), this);

    auto bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qCCritical(lcDbus) << "Cannot connect to session D-Bus";
        return false;
    }

    if (!bus.registerService(QString(DBus::ServiceName))) {
        qCCritical(lcDbus) << "Failed to register D-Bus service:" << DBus::ServiceName
                           << "Error:" << bus.lastError().message();
        return false;
    }

    if (!bus.registerObject(QString(DBus::ObjectPath), this)) {
        qCCritical(lcDbus) << "Failed to register D-Bus object:" << DBus::ObjectPath
                           << "Error:" << bus.lastError().message();
        bus.unregisterService(QString(DBus::ServiceName));
        return false;
    }

    qCInfo(lcDbus) << "D-Bus service registered service=" << DBus::ServiceName << "path=" << DBus::ObjectPath;
    return true;
}

void Application::start()
{
    if (m_running) {
        return;
    }

    if (m_settings->positionOnStartup()) {
        m_overlayController->schedulePlacement(Defaults::StartupPlacementDelayMs);
    }

    m_running = true;
}

void Application::stop()
{
    if (!m_running) {
        return;
    }

    if (!m_noteSession->flush()) {
        qCWarning(lcApp) << "Unsaved note changes lost on shutdown:" << m_noteSession->lastError();
    }
    m_settings->save();

    QDBusConnection::sessionBus().unregisterObject(QString(DBus::ObjectPath));
    QDBusConnection::sessionBus().unregisterService(QString(DBus::ServiceName));

    m_running = false;
    qCInfo(lcApp) << "Stopped";
}

} // namespace TopNote
