// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "togglecoordinator.h"
#include "constants.h"
#include "interfaces.h"
#include "logging.h"
#include "overlayenforcer.h"
#include "overlayplacer.h"
#include "overlaystatestore.h"
#include <QPointer>

namespace TopNote {

ToggleCoordinator::ToggleCoordinator(IWindowOverlayDriver* driver, OverlayStateStore* state,
                                     const OverlayEnforcer* enforcer, ITaskScheduler* scheduler, QObject* parent)
    : QObject(parent)
    , m_driver(driver)
    , m_state(state)
    , m_enforcer(enforcer)
    , m_scheduler(scheduler)
    , m_guard(std::make_shared<ToggleGuard>())
{
    Q_ASSERT(driver);
    Q_ASSERT(state);
    Q_ASSERT(enforcer);
    Q_ASSERT(scheduler);
}

ToggleCoordinator::~ToggleCoordinator() = default;

void ToggleCoordinator::setPlacer(OverlayPlacer* placer)
{
    m_placer = placer;
}

void ToggleCoordinator::onHotkeyTriggered()
{
    requestToggle();
}

bool ToggleCoordinator::requestToggle()
{
    std::optional<ToggleGuard::Lease> lease = m_guard->tryAcquire();
    if (!lease) {
        qCDebug(lcToggle) << "Toggle already in flight, dropping trigger";
        Q_EMIT triggerDropped();
        return false;
    }

    auto sequence = std::make_shared<Sequence>(Sequence{m_guard, std::move(*lease), m_scheduler->elapsedMs()});
    Q_EMIT toggleStarted();

    // Run the sequence as its own task so the hotkey listener returns immediately
    m_scheduler->schedule(0, [self = QPointer<ToggleCoordinator>(this), sequence]() {
        if (self) {
            self->runSequence(sequence);
        }
    });
    return true;
}

void ToggleCoordinator::runSequence(const SequencePtr& sequence)
{
    if (!m_driver->isValid()) {
        qCWarning(lcToggle) << "Cannot toggle overlay - window handle is no longer valid";
        finishSequence(sequence);
        return;
    }

    // The compositor can unmap the panel on its own (output removed, layer
    // surface closed), so the live window decides and the store follows it
    const bool liveVisible = m_driver->isVisible();
    if (m_state->isVisible() != liveVisible) {
        qCInfo(lcToggle) << "Overlay visibility changed outside the toggle, resyncing to"
                         << (liveVisible ? "visible" : "hidden");
        m_state->setVisibility(liveVisible ? VisibilityState::Visible : VisibilityState::Hidden);
    }

    if (liveVisible) {
        hideSequence(sequence);
    } else {
        showSequence(sequence);
    }
}

void ToggleCoordinator::hideSequence(const SequencePtr& sequence)
{
    const OperationResult hidden = m_driver->hide();
    if (!hidden) {
        qCWarning(lcToggle) << "Failed to hide overlay:" << hidden.errorMessage;
    } else {
        m_state->setVisibility(VisibilityState::Hidden);
        qCInfo(lcToggle) << "Overlay hidden via toggle shortcut";
    }
    finishSequence(sequence);
}

void ToggleCoordinator::showSequence(const SequencePtr& sequence)
{
    m_state->setVisibility(VisibilityState::Showing);

    // First show: move to the top-right corner before mapping the window
    if (m_placer && !m_state->hasBeenPlaced()) {
        const OperationResult placed = m_placer->positionTopRight();
        if (!placed) {
            qCWarning(lcToggle) << "Skipping first-show placement:" << placed.errorMessage;
        }
    }

    const OperationResult shown = m_driver->show();
    if (!shown) {
        qCWarning(lcToggle) << "Failed to show overlay:" << shown.errorMessage;
        m_state->setVisibility(VisibilityState::Hidden);
        finishSequence(sequence);
        return;
    }

    m_scheduler->schedule(Defaults::SettleDelayMs, [self = QPointer<ToggleCoordinator>(this), sequence]() {
        if (self) {
            self->runEnforcementAttempt(sequence, 1);
        }
    });
}

void ToggleCoordinator::runEnforcementAttempt(const SequencePtr& sequence, int attempt)
{
    // Window levels assigned right after a show are not reliably kept by every
    // compositor, so the full configuration is re-applied a fixed number of times.
    const OperationResult enforced = m_enforcer->enforce(m_driver);
    if (!enforced) {
        qCWarning(lcToggle) << "Failed to re-apply overlay settings on show (attempt" << attempt << "of"
                            << Defaults::EnforcementAttempts << "):" << enforced.errorMessage;
    }

    if (attempt < Defaults::EnforcementAttempts) {
        m_scheduler->schedule(Defaults::EnforcementRetryIntervalMs,
                              [self = QPointer<ToggleCoordinator>(this), sequence, attempt]() {
                                  if (self) {
                                      self->runEnforcementAttempt(sequence, attempt + 1);
                                  }
                              });
        return;
    }

    if (!m_driver->isValid()) {
        qCWarning(lcToggle) << "Overlay window went away while showing";
        m_state->setVisibility(VisibilityState::Hidden);
    } else {
        m_state->setVisibility(VisibilityState::Visible);
        qCInfo(lcToggle) << "Overlay shown via toggle shortcut";
    }
    finishSequence(sequence);
}

void ToggleCoordinator::finishSequence(const SequencePtr& sequence)
{
    Q_EMIT toggleFinished(m_state->visibility());

    const qint64 elapsed = m_scheduler->elapsedMs() - sequence->triggeredAt;
    const int remaining = static_cast<int>(qMax<qint64>(0, Defaults::ToggleCooldownMs - elapsed));
    qCDebug(lcToggle) << "Toggle finished after" << elapsed << "ms, releasing guard in" << remaining << "ms";

    m_scheduler->schedule(remaining, [self = QPointer<ToggleCoordinator>(this), sequence]() {
        sequence->lease.release();
        if (self) {
            Q_EMIT self->guardReleased();
        }
    });
}

} // namespace TopNote
