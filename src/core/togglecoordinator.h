// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "toggleguard.h"
#include "topnote_export.h"
#include "types.h"
#include <QObject>
#include <memory>

namespace TopNote {

class IWindowOverlayDriver;
class ITaskScheduler;
class OverlayEnforcer;
class OverlayPlacer;
class OverlayStateStore;

/**
 * @brief Debounced show/hide state machine driven by the global hotkey
 *
 * A trigger acquires the ToggleGuard and submits the toggle sequence to the
 * scheduler, so the hotkey listener never waits on delays. Triggers arriving
 * while a sequence is in flight are dropped.
 *
 * The direction is taken from the live window, not from the state store;
 * a store that drifted is resynced first.
 *
 * Hide: one hide call, state -> Hidden.
 * Show: place on first show, show, wait Defaults::SettleDelayMs, then run the
 * enforcer Defaults::EnforcementAttempts times, Defaults::EnforcementRetryIntervalMs
 * apart, tolerating failures. State -> Visible afterwards.
 *
 * The guard is released Defaults::ToggleCooldownMs after the trigger was
 * received, or when the sequence completes if that is later. Every failure is
 * logged and swallowed; none of them can leave the guard held.
 */
class TOPNOTE_EXPORT ToggleCoordinator : public QObject
{
    Q_OBJECT

public:
    ToggleCoordinator(IWindowOverlayDriver* driver, OverlayStateStore* state, const OverlayEnforcer* enforcer,
                      ITaskScheduler* scheduler, QObject* parent = nullptr);
    ~ToggleCoordinator() override;

    /**
     * @brief Placer used for the first show (optional)
     */
    void setPlacer(OverlayPlacer* placer);

    /**
     * @brief Start a toggle sequence unless one is already in flight
     * @return false if the trigger was dropped
     */
    bool requestToggle();

    bool isToggleInFlight() const
    {
        return m_guard->isHeld();
    }

    /**
     * @brief Direct access to the single-flight guard
     */
    ToggleGuard& guard()
    {
        return *m_guard;
    }

public Q_SLOTS:
    /**
     * @brief Hotkey entry point, fire-and-forget
     */
    void onHotkeyTriggered();

Q_SIGNALS:
    void toggleStarted();
    void toggleFinished(VisibilityState state);
    void triggerDropped();
    void guardReleased();

private:
    /**
     * @brief State shared by the continuations of one toggle sequence
     *
     * The guard outlives the lease (members are destroyed in reverse order),
     * so a continuation dropped after the coordinator is gone still releases
     * a live guard.
     */
    struct Sequence {
        std::shared_ptr<ToggleGuard> guard;
        ToggleGuard::Lease lease;
        qint64 triggeredAt = 0;
    };
    using SequencePtr = std::shared_ptr<Sequence>;

    void runSequence(const SequencePtr& sequence);
    void hideSequence(const SequencePtr& sequence);
    void showSequence(const SequencePtr& sequence);
    void runEnforcementAttempt(const SequencePtr& sequence, int attempt);
    void finishSequence(const SequencePtr& sequence);

    IWindowOverlayDriver* m_driver = nullptr;
    OverlayStateStore* m_state = nullptr;
    const OverlayEnforcer* m_enforcer = nullptr;
    ITaskScheduler* m_scheduler = nullptr;
    OverlayPlacer* m_placer = nullptr;

    std::shared_ptr<ToggleGuard> m_guard;
};

} // namespace TopNote
