// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "application.h"
#include "../core/logging.h"
#include "../core/overlaycontroller.h"
#include <QGuiApplication>
#include <QCommandLineParser>
#include <KAboutData>
#include <KLocalizedString>
#include <KDBusService>
#include <signal.h>

using namespace TopNote;

static Application* g_application = nullptr;

void signalHandler(int /*signal*/)
{
    if (g_application) {
        g_application->stop();
    }
    QCoreApplication::quit();
}

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);

    // The panel is hidden most of the time; hiding it must not end the process
    app.setQuitOnLastWindowClosed(false);

    // Set translation domain BEFORE any i18n() calls
    KLocalizedString::setApplicationDomain("topnote");

    KAboutData aboutData(QStringLiteral("topnote"), i18n("TopNote"), QStringLiteral("1.0.0"),
                         i18n("Always-on-top scratch notes behind a global shortcut"), KAboutLicense::GPL_V3,
                         i18n("© 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    aboutData.setDesktopFileName(QStringLiteral("org.topnote"));

    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption replaceOption(QStringList{QStringLiteral("r"), QStringLiteral("replace")},
                                     i18n("Replace existing TopNote instance"));
    parser.addOption(replaceOption);

    parser.process(app);
    aboutData.processCommandLine(&parser);

    // Ensure single instance
    KDBusService::StartupOptions options = KDBusService::Unique;
    if (parser.isSet(replaceOption)) {
        options |= KDBusService::Replace;
    }

    KDBusService service(options);

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    signal(SIGHUP, signalHandler);

    Application application;
    g_application = &application;

    if (!application.init()) {
        qCCritical(TopNote::lcApp) << "Failed to initialize TopNote";
        g_application = nullptr;
        return 1;
    }

    qCInfo(TopNote::lcApp) << "Started successfully";
    application.start();

    // Launching topnote again toggles the running instance's panel
    QObject::connect(&service, &KDBusService::activateRequested, &application, [&application]() {
        const OperationResult result = application.overlayController()->toggle();
        if (!result) {
            qCDebug(TopNote::lcApp) << "Activation request ignored:" << result.errorMessage;
        }
    });

    int result = app.exec();

    application.stop();
    g_application = nullptr;

    return result;
}
