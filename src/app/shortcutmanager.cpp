// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "shortcutmanager.h"
#include "../config/configdefaults.h"
#include "../config/settings.h"
#include "../core/logging.h"
#include <QAction>
#include <QKeySequence>
#include <KGlobalAccel>
#include <KLocalizedString>

namespace TopNote {

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Macros
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Setup a global shortcut action
 * @param actionMember Pointer to QAction* member variable
 * @param i18nName Translatable display name for the action
 * @param objectName QStringLiteral object name for KGlobalAccel
 * @param getterName Method name (must exist on both ConfigDefaults and Settings)
 * @param slot Slot to connect to QAction::triggered
 * @param ok bool receiving the registration result
 *
 * Uses ConfigDefaults::getterName() for setDefaultShortcut so System Settings
 * shows the true app default when resetting. Uses m_settings->getterName() for
 * the actual shortcut (user's config or default).
 */
#define SETUP_SHORTCUT(actionMember, i18nName, objectName, getterName, slot, ok) \
    do { \
        if (!actionMember) { \
            actionMember = new QAction(i18n(i18nName), this); \
            actionMember->setObjectName(QStringLiteral(objectName)); \
            const QKeySequence defaultShortcut(ConfigDefaults::getterName()); \
            const QKeySequence shortcut(m_settings->getterName()); \
            ok = KGlobalAccel::self()->setDefaultShortcut(actionMember, {defaultShortcut}) \
                && KGlobalAccel::setGlobalShortcut(actionMember, shortcut); \
            connect(actionMember, &QAction::triggered, this, slot); \
        } \
    } while (0)

/**
 * @brief Update a global shortcut from settings
 * @param actionMember Pointer to QAction* member variable
 * @param settingsGetter Settings method to get the shortcut string
 */
#define UPDATE_SHORTCUT(actionMember, settingsGetter) \
    do { \
        if (actionMember) { \
            if (!KGlobalAccel::setGlobalShortcut(actionMember, QKeySequence(m_settings->settingsGetter()))) { \
                qCWarning(lcShortcuts) << "Failed to rebind" << actionMember->objectName() << "to" \
                                       << m_settings->settingsGetter(); \
            } \
        } \
    } while (0)

/**
 * @brief Delete and null a shortcut action
 * @param actionMember Pointer to QAction* member variable
 */
#define DELETE_SHORTCUT(actionMember) \
    do { \
        delete actionMember; \
        actionMember = nullptr; \
    } while (0)

// ═══════════════════════════════════════════════════════════════════════════════
// Constructor / Destructor
// ═══════════════════════════════════════════════════════════════════════════════

ShortcutManager::ShortcutManager(Settings* settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
{
    Q_ASSERT(settings);

    connect(m_settings, &Settings::toggleOverlayShortcutChanged, this,
            &ShortcutManager::updateToggleOverlayShortcut);

    // Settings::load() only emits settingsChanged(), not the per-key signals
    connect(m_settings, &Settings::settingsChanged, this, &ShortcutManager::updateShortcuts);
}

ShortcutManager::~ShortcutManager()
{
    unregisterShortcuts();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Registration
// ═══════════════════════════════════════════════════════════════════════════════

bool ShortcutManager::registerShortcuts()
{
    bool registered = true;
    SETUP_SHORTCUT(m_toggleOverlayAction, "Toggle Notes Panel", "toggle_overlay", toggleOverlayShortcut,
                   &ShortcutManager::onToggleOverlay, registered);

    if (!registered) {
        qCCritical(lcShortcuts) << "Failed to register global shortcut" << m_settings->toggleOverlayShortcut();
        return false;
    }

    qCInfo(lcShortcuts) << "Registered toggle shortcut" << toggleOverlayShortcutText();
    return true;
}

void ShortcutManager::updateShortcuts()
{
    UPDATE_SHORTCUT(m_toggleOverlayAction, toggleOverlayShortcut);
}

void ShortcutManager::unregisterShortcuts()
{
    // KGlobalAccel drops the grab when the action is deleted; the binding stays in kglobalshortcutsrc
    DELETE_SHORTCUT(m_toggleOverlayAction);
}

QString ShortcutManager::toggleOverlayShortcutText() const
{
    if (!m_toggleOverlayAction) {
        return m_settings->toggleOverlayShortcut();
    }
    const QList<QKeySequence> bound = KGlobalAccel::self()->shortcut(m_toggleOverlayAction);
    if (bound.isEmpty()) {
        return m_settings->toggleOverlayShortcut();
    }
    return bound.first().toString(QKeySequence::PortableText);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Slots
// ═══════════════════════════════════════════════════════════════════════════════

void ShortcutManager::onToggleOverlay()
{
    qCDebug(lcShortcuts) << "Toggle shortcut triggered";
    Q_EMIT toggleOverlayRequested();
}

void ShortcutManager::updateToggleOverlayShortcut()
{
    UPDATE_SHORTCUT(m_toggleOverlayAction, toggleOverlayShortcut);
}

#undef SETUP_SHORTCUT
#undef UPDATE_SHORTCUT
#undef DELETE_SHORTCUT

} // namespace TopNote
