// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "overlaycontroller.h"
#include "interfaces.h"
#include "logging.h"
#include "overlayenforcer.h"
#include "overlayplacer.h"
#include "overlaystatestore.h"
#include "togglecoordinator.h"
#include <QPointer>

namespace TopNote {

namespace {
QString boolText(bool value)
{
    return value ? QStringLiteral("true") : QStringLiteral("false");
}
} // namespace

OverlayController::OverlayController(IWindowOverlayDriver* driver, OverlayStateStore* state,
                                     const OverlayEnforcer* enforcer, OverlayPlacer* placer,
                                     ToggleCoordinator* coordinator, ITaskScheduler* scheduler, QObject* parent)
    : QObject(parent)
    , m_driver(driver)
    , m_state(state)
    , m_enforcer(enforcer)
    , m_placer(placer)
    , m_coordinator(coordinator)
    , m_scheduler(scheduler)
{
    Q_ASSERT(driver);
    Q_ASSERT(state);
    Q_ASSERT(enforcer);
    Q_ASSERT(placer);
    Q_ASSERT(coordinator);
    Q_ASSERT(scheduler);

    connect(m_state, &OverlayStateStore::visibilityChanged, this, [this](VisibilityState state) {
        // Showing is transient; observers only care about settled states
        if (state != VisibilityState::Showing) {
            Q_EMIT visibilityChanged(state == VisibilityState::Visible);
        }
    });
}

OperationResult OverlayController::toggle()
{
    if (!m_coordinator->requestToggle()) {
        return OperationResult::failure(QStringLiteral("A toggle is already in progress"));
    }
    return OperationResult::ok();
}

OperationResult OverlayController::forceToTop()
{
    const OperationResult enforced = m_enforcer->enforce(m_driver);
    if (!enforced) {
        qCWarning(lcOverlay) << "Failed to force overlay on top:" << enforced.errorMessage;
        return enforced;
    }

    const OperationResult raised = m_driver->raise();
    if (!raised) {
        qCWarning(lcOverlay) << "Failed to raise overlay:" << raised.errorMessage;
        return raised;
    }

    qCInfo(lcOverlay) << "Forced overlay on top";
    return OperationResult::ok();
}

OperationResult OverlayController::positionTopRight()
{
    return m_placer->positionTopRight();
}

OperationResult OverlayController::ensureTopLevel()
{
    const OperationResult enforced = m_enforcer->enforce(m_driver);
    if (!enforced) {
        qCWarning(lcOverlay) << "Failed to apply overlay configuration:" << enforced.errorMessage;
    }
    return enforced;
}

OperationResult OverlayController::moveTo(const QPoint& topLeft)
{
    if (!m_driver->isValid()) {
        return OperationResult::failure(QStringLiteral("Window handle is no longer valid"));
    }

    const OperationResult moved = m_driver->setPosition(topLeft);
    if (!moved) {
        qCWarning(lcPlacement) << "Failed to move overlay to" << topLeft << ":" << moved.errorMessage;
        return moved;
    }

    m_state->setPlaced(true);
    return OperationResult::ok();
}

void OverlayController::dragBy(int dx, int dy)
{
    if (dx == 0 && dy == 0) {
        return;
    }
    if (!m_driver->isValid()) {
        return;
    }
    const OperationResult moved = moveTo(m_driver->position() + QPoint(dx, dy));
    if (!moved) {
        qCDebug(lcPlacement) << "Dropped drag step" << dx << dy;
    }
}

QString OverlayController::debugInfo() const
{
    QString info;
    if (!m_driver->isValid()) {
        info += QStringLiteral("Window valid: false\n");
    } else {
        const OverlayConfig live = m_driver->currentConfig();
        const OverlayConfig& target = m_enforcer->target();
        info += QStringLiteral("Window visible: %1\n").arg(boolText(m_driver->isVisible()));
        info += QStringLiteral("Always on top: %1\n").arg(boolText(live.alwaysOnTop));
        info += QStringLiteral("All workspaces: %1\n").arg(boolText(live.allWorkspaces));
        info += QStringLiteral("Level: %1\n").arg(live.level);
        info += QStringLiteral("Position: %1,%2\n").arg(m_driver->position().x()).arg(m_driver->position().y());
        info += QStringLiteral("Non-activating: %1\n").arg(boolText(live.nonActivating));
        info += QStringLiteral("Accepts mouse events: %1\n").arg(boolText(live.acceptsMouseEvents));
        info += QStringLiteral("Matches overlay configuration: %1\n").arg(boolText(live == target));
    }
    info += QStringLiteral("Visibility state: %1\n").arg(visibilityStateToString(m_state->visibility()));
    info += QStringLiteral("Toggle in flight: %1\n").arg(boolText(m_coordinator->isToggleInFlight()));
    info += QStringLiteral("Platform: %1\n").arg(m_driver->platformName());

    qCDebug(lcOverlay).noquote() << "Debug window info:\n" << info;
    return info;
}

void OverlayController::schedulePlacement(int delayMs)
{
    m_scheduler->schedule(delayMs, [self = QPointer<OverlayController>(this)]() {
        if (!self) {
            return;
        }
        const OperationResult placed = self->positionTopRight();
        if (!placed) {
            qCWarning(lcPlacement) << "Startup placement failed:" << placed.errorMessage;
        }
    });
}

bool OverlayController::isVisible() const
{
    return m_state->isVisible();
}

} // namespace TopNote
