// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>

#include "core/constants.h"
#include "core/overlaycontroller.h"
#include "core/overlayenforcer.h"
#include "core/overlayplacer.h"
#include "core/overlaystatestore.h"
#include "core/togglecoordinator.h"
#include "helpers/manualtaskscheduler.h"
#include "helpers/mockoverlaydriver.h"

using namespace TopNote;

/**
 * @brief Unit tests for the OverlayController window-command surface
 *
 * Tests cover:
 * - toggle() shares the hotkey's single-flight guard
 * - forceToTop() / ensureTopLevel() success and error text
 * - positionTopRight() delegation
 * - moveTo() / dragBy() title bar moves
 * - debugInfo() report for valid and destroyed windows
 * - visibilityChanged(bool) only for settled states
 * - Deferred startup placement
 */
class TestOverlayController : public QObject
{
    Q_OBJECT

private:
    struct Fixture {
        Fixture()
        {
            placer.setMargins(Defaults::PlacementMarginX, Defaults::PlacementMarginY);
            coordinator.setPlacer(&placer);
        }

        MockOverlayDriver driver;
        OverlayStateStore state;
        OverlayEnforcer enforcer;
        ManualTaskScheduler scheduler;
        OverlayPlacer placer{&driver, &state};
        ToggleCoordinator coordinator{&driver, &state, &enforcer, &scheduler};
        OverlayController controller{&driver, &state, &enforcer, &placer, &coordinator, &scheduler};
    };

private Q_SLOTS:

    // ═══════════════════════════════════════════════════════════════════════════
    // toggle
    // ═══════════════════════════════════════════════════════════════════════════

    void test_toggle_showsPanel()
    {
        Fixture f;
        QVERIFY(f.controller.toggle().success);
        f.scheduler.runUntilIdle();

        QVERIFY(f.controller.isVisible());
        QCOMPARE(f.driver.callCount(QStringLiteral("show")), 1);
    }

    void test_toggle_inFlight_reportsError()
    {
        Fixture f;
        QVERIFY(f.controller.toggle().success);

        const OperationResult second = f.controller.toggle();
        QVERIFY(!second.success);
        QCOMPARE(second.errorMessage, QStringLiteral("A toggle is already in progress"));

        f.scheduler.runUntilIdle();
        QCOMPARE(f.driver.callCount(QStringLiteral("show")), 1);
    }

    void test_toggle_blockedByHotkeySequence()
    {
        Fixture f;
        f.coordinator.onHotkeyTriggered();

        QVERIFY(!f.controller.toggle().success);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // forceToTop / ensureTopLevel
    // ═══════════════════════════════════════════════════════════════════════════

    void test_forceToTop_enforcesThenRaises()
    {
        Fixture f;
        QVERIFY(f.controller.forceToTop().success);

        const QStringList calls = f.driver.calls();
        QCOMPARE(calls.last(), QStringLiteral("raise"));
        QCOMPARE(f.driver.currentConfig(), OverlayConfig::target());
    }

    void test_forceToTop_enforceFailure_noRaise()
    {
        Fixture f;
        f.driver.failCall(QStringLiteral("setLevel"), -1, QStringLiteral("level rejected"));

        const OperationResult result = f.controller.forceToTop();
        QVERIFY(!result.success);
        QCOMPARE(result.errorMessage, QStringLiteral("setLevel failed: level rejected"));
        QCOMPARE(f.driver.callCount(QStringLiteral("raise")), 0);
    }

    void test_forceToTop_raiseFailure()
    {
        Fixture f;
        f.driver.failCall(QStringLiteral("raise"), -1, QStringLiteral("cannot raise"));

        const OperationResult result = f.controller.forceToTop();
        QVERIFY(!result.success);
        QCOMPARE(result.errorMessage, QStringLiteral("cannot raise"));
    }

    void test_ensureTopLevel_noRaise()
    {
        Fixture f;
        QVERIFY(f.controller.ensureTopLevel().success);
        QCOMPARE(f.driver.callCount(QStringLiteral("raise")), 0);
        QCOMPARE(f.driver.currentConfig(), OverlayConfig::target());
    }

    void test_commands_invalidHandle()
    {
        Fixture f;
        f.driver.invalidate();

        const QString expected = QStringLiteral("Window handle is no longer valid");
        QCOMPARE(f.controller.forceToTop().errorMessage, expected);
        QCOMPARE(f.controller.ensureTopLevel().errorMessage, expected);
        QCOMPARE(f.controller.positionTopRight().errorMessage, expected);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // positionTopRight
    // ═══════════════════════════════════════════════════════════════════════════

    void test_positionTopRight()
    {
        Fixture f;
        QVERIFY(f.controller.positionTopRight().success);
        QCOMPARE(f.driver.position(), QPoint(1500, 40));
    }

    void test_positionTopRight_noMonitor()
    {
        Fixture f;
        f.driver.setMonitors({});

        const OperationResult result = f.controller.positionTopRight();
        QVERIFY(!result.success);
        QCOMPARE(result.errorMessage, QStringLiteral("No primary monitor found"));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // moveTo / dragBy
    // ═══════════════════════════════════════════════════════════════════════════

    void test_moveTo_keepsPositionOnFirstShow()
    {
        Fixture f;
        QVERIFY(f.controller.moveTo(QPoint(300, 200)).success);
        QCOMPARE(f.driver.position(), QPoint(300, 200));
        QVERIFY(f.state.hasBeenPlaced());

        f.controller.toggle();
        f.scheduler.runUntilIdle();

        QVERIFY(f.controller.isVisible());
        QCOMPARE(f.driver.callCount(QStringLiteral("setPosition")), 1);
        QCOMPARE(f.driver.position(), QPoint(300, 200));
    }

    void test_moveTo_driverFailure()
    {
        Fixture f;
        f.driver.failCall(QStringLiteral("setPosition"), -1, QStringLiteral("move rejected"));

        const OperationResult result = f.controller.moveTo(QPoint(10, 10));
        QVERIFY(!result.success);
        QCOMPARE(result.errorMessage, QStringLiteral("move rejected"));
        QVERIFY(!f.state.hasBeenPlaced());
    }

    void test_moveTo_invalidHandle()
    {
        Fixture f;
        f.driver.invalidate();

        QCOMPARE(f.controller.moveTo(QPoint(10, 10)).errorMessage, QStringLiteral("Window handle is no longer valid"));
        QCOMPARE(f.driver.callCount(QStringLiteral("setPosition")), 0);
    }

    void test_dragBy_movesRelativeToCurrentPosition()
    {
        Fixture f;
        QVERIFY(f.controller.positionTopRight().success);

        f.controller.dragBy(-100, 25);
        QCOMPARE(f.driver.position(), QPoint(1400, 65));

        f.controller.dragBy(-50, -5);
        QCOMPARE(f.driver.position(), QPoint(1350, 60));
        QCOMPARE(f.driver.callCount(QStringLiteral("setPosition")), 3);
    }

    void test_dragBy_zeroDelta_noMove()
    {
        Fixture f;
        f.controller.dragBy(0, 0);
        QCOMPARE(f.driver.callCount(QStringLiteral("setPosition")), 0);
        QVERIFY(!f.state.hasBeenPlaced());
    }

    void test_dragBy_invalidHandle_noCalls()
    {
        Fixture f;
        f.driver.invalidate();

        f.controller.dragBy(10, 10);
        QVERIFY(f.driver.calls().isEmpty());
    }

    void test_schedulePlacement_deferred()
    {
        Fixture f;
        f.controller.schedulePlacement(Defaults::StartupPlacementDelayMs);

        f.scheduler.advance(Defaults::StartupPlacementDelayMs - 1);
        QCOMPARE(f.driver.callCount(QStringLiteral("setPosition")), 0);

        f.scheduler.advance(1);
        QCOMPARE(f.driver.position(), QPoint(1500, 40));
        QVERIFY(f.state.hasBeenPlaced());
    }

    void test_schedulePlacement_failureIsHarmless()
    {
        Fixture f;
        f.driver.setMonitors({});
        f.controller.schedulePlacement(Defaults::StartupPlacementDelayMs);

        f.scheduler.runUntilIdle();
        QCOMPARE(f.driver.callCount(QStringLiteral("setPosition")), 0);
        QVERIFY(!f.state.hasBeenPlaced());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // debugInfo
    // ═══════════════════════════════════════════════════════════════════════════

    void test_debugInfo_reportsLiveState()
    {
        Fixture f;
        f.controller.ensureTopLevel();

        const QString info = f.controller.debugInfo();
        QVERIFY(info.contains(QStringLiteral("Window visible: false")));
        QVERIFY(info.contains(QStringLiteral("Always on top: true")));
        QVERIFY(info.contains(QStringLiteral("All workspaces: true")));
        QVERIFY(info.contains(QStringLiteral("Level: %1").arg(Defaults::MaxWindowLevel)));
        QVERIFY(info.contains(QStringLiteral("Non-activating: true")));
        QVERIFY(info.contains(QStringLiteral("Position: 0,0")));
        QVERIFY(info.contains(QStringLiteral("Matches overlay configuration: true")));
        QVERIFY(info.contains(QStringLiteral("Visibility state: Hidden")));
        QVERIFY(info.contains(QStringLiteral("Platform: mock")));
    }

    void test_debugInfo_plainWindow()
    {
        Fixture f;
        const QString info = f.controller.debugInfo();
        QVERIFY(info.contains(QStringLiteral("Always on top: false")));
        QVERIFY(info.contains(QStringLiteral("Matches overlay configuration: false")));
    }

    void test_debugInfo_invalidHandle()
    {
        Fixture f;
        f.driver.invalidate();

        const QString info = f.controller.debugInfo();
        QVERIFY(info.startsWith(QStringLiteral("Window valid: false")));
        QVERIFY(!info.contains(QStringLiteral("Always on top")));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Signals
    // ═══════════════════════════════════════════════════════════════════════════

    void test_visibilityChanged_settledStatesOnly()
    {
        Fixture f;
        QSignalSpy spy(&f.controller, &OverlayController::visibilityChanged);

        f.controller.toggle();
        f.scheduler.runUntilIdle();
        f.controller.toggle();
        f.scheduler.runUntilIdle();

        QCOMPARE(spy.count(), 2);
        QCOMPARE(spy.at(0).at(0).toBool(), true);
        QCOMPARE(spy.at(1).at(0).toBool(), false);
    }
};

QTEST_MAIN(TestOverlayController)
#include "test_overlay_controller.moc"
