// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QGuiApplication>
#include <QScreen>
#include <QWindow>
#include <memory>

#include "app/platform/overlaydriverfactory.h"
#include "app/platform/x11overlaydriver.h"
#include "core/overlayenforcer.h"

using namespace TopNote;

/**
 * @brief Unit tests for X11OverlayDriver's window-hint mapping
 *
 * Runs on the offscreen platform: only Qt window state is checked, never
 * what an X server does with it.
 *
 * Tests cover:
 * - Conversion sets the panel hints and must precede the first show
 * - A full enforcement pass reports the target configuration
 * - Individual setters clear what they set
 * - Destroyed windows turn every call into an error
 * - The factory follows the loaded platform plugin
 */
class TestX11OverlayDriver : public QObject
{
    Q_OBJECT

private Q_SLOTS:

    void test_convert_setsPanelHints()
    {
        QWindow window;
        X11OverlayDriver driver(&window);

        QVERIFY(driver.convertToOverlayPanel().success);

        const Qt::WindowFlags flags = window.flags();
        QCOMPARE(window.type(), Qt::Tool);
        QVERIFY(flags.testFlag(Qt::FramelessWindowHint));
        QVERIFY(flags.testFlag(Qt::WindowStaysOnTopHint));
        QVERIFY(flags.testFlag(Qt::X11BypassWindowManagerHint));
        QVERIFY(!flags.testFlag(Qt::WindowTransparentForInput));
        QCOMPARE(driver.currentConfig(), OverlayConfig::target());
    }

    void test_convert_afterShow_fails()
    {
        QWindow window;
        window.show();
        X11OverlayDriver driver(&window);

        QVERIFY(!driver.convertToOverlayPanel().success);
    }

    void test_enforce_reachesTarget()
    {
        QWindow window;
        X11OverlayDriver driver(&window);
        OverlayEnforcer enforcer;

        QVERIFY(driver.currentConfig() != OverlayConfig::target());
        QVERIFY(enforcer.enforce(&driver).success);
        QCOMPARE(driver.currentConfig(), OverlayConfig::target());

        // Second pass leaves the flags alone
        const Qt::WindowFlags before = window.flags();
        QVERIFY(enforcer.enforce(&driver).success);
        QCOMPARE(window.flags(), before);
    }

    void test_alwaysOnTop_toggle()
    {
        QWindow window;
        X11OverlayDriver driver(&window);
        QVERIFY(driver.convertToOverlayPanel().success);

        QVERIFY(driver.setAlwaysOnTop(false).success);
        QVERIFY(!window.flags().testFlag(Qt::WindowStaysOnTopHint));
        QVERIFY(!driver.currentConfig().alwaysOnTop);
        QCOMPARE(driver.currentConfig().level, 0);

        QVERIFY(driver.setAlwaysOnTop(true).success);
        QCOMPARE(driver.currentConfig().level, Defaults::MaxWindowLevel);
    }

    void test_bypassHint_sharedByWorkspacesAndActivation()
    {
        QWindow window;
        X11OverlayDriver driver(&window);
        QVERIFY(driver.convertToOverlayPanel().success);

        QVERIFY(driver.setNonActivating(false).success);
        QVERIFY(window.flags().testFlag(Qt::X11BypassWindowManagerHint));
        QVERIFY(!driver.currentConfig().nonActivating);
        QVERIFY(driver.currentConfig().allWorkspaces);

        QVERIFY(driver.setVisibleOnAllWorkspaces(false).success);
        QVERIFY(!window.flags().testFlag(Qt::X11BypassWindowManagerHint));
    }

    void test_mouseEvents_andCycleExclusion()
    {
        QWindow window;
        X11OverlayDriver driver(&window);
        QVERIFY(driver.convertToOverlayPanel().success);

        QVERIFY(driver.setAcceptsMouseEvents(false).success);
        QVERIFY(window.flags().testFlag(Qt::WindowTransparentForInput));
        QVERIFY(driver.setAcceptsMouseEvents(true).success);
        QVERIFY(!window.flags().testFlag(Qt::WindowTransparentForInput));

        QVERIFY(driver.setCollectionBehavior(CollectionBehavior::CanJoinAllSpaces).success);
        QCOMPARE(window.type(), Qt::Window);
        QVERIFY(window.flags().testFlag(Qt::FramelessWindowHint));
    }

    void test_negativeLevel_rejected()
    {
        QWindow window;
        X11OverlayDriver driver(&window);
        QVERIFY(!driver.setLevel(-1).success);
    }

    void test_setPosition_movesFrame()
    {
        QWindow window;
        window.resize(200, 100);
        X11OverlayDriver driver(&window);

        QVERIFY(driver.setPosition(QPoint(120, 40)).success);
        QCOMPARE(window.framePosition(), QPoint(120, 40));
        QCOMPARE(driver.position(), QPoint(120, 40));
    }

    void test_monitorGeometries_primaryFirst()
    {
        QWindow window;
        X11OverlayDriver driver(&window);

        const QVector<QRect> monitors = driver.monitorGeometries();
        QVERIFY(!monitors.isEmpty());
        QCOMPARE(monitors.first(), QGuiApplication::primaryScreen()->geometry());
    }

    void test_factory_followsLoadedPlugin()
    {
        // Wayland session variables with a non-Wayland plugin must not pick layer-shell
        const QByteArray saved = qgetenv("WAYLAND_DISPLAY");
        qputenv("WAYLAND_DISPLAY", "wayland-0");

        QWindow window;
        QVERIFY(!createOverlayDriver(&window));

        if (saved.isNull()) {
            qunsetenv("WAYLAND_DISPLAY");
        } else {
            qputenv("WAYLAND_DISPLAY", saved);
        }
    }

    void test_destroyedWindow_invalidatesDriver()
    {
        auto window = std::make_unique<QWindow>();
        X11OverlayDriver driver(window.get());
        QVERIFY(driver.isValid());

        window.reset();

        QVERIFY(!driver.isValid());
        QVERIFY(!driver.isVisible());
        QCOMPARE(driver.show().errorMessage, QStringLiteral("Window handle is no longer valid"));
        QVERIFY(!driver.setLevel(Defaults::MaxWindowLevel).success);
        QVERIFY(!driver.setPosition(QPoint(0, 0)).success);
        QVERIFY(driver.outerSize().isEmpty());
        QCOMPARE(driver.position(), QPoint());
    }
};

QTEST_MAIN(TestX11OverlayDriver)
#include "test_x11_overlay_driver.moc"
