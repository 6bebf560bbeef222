// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "topnote_export.h"
#include "types.h"
#include <QObject>
#include <QPoint>
#include <QString>

namespace TopNote {

class IWindowOverlayDriver;
class ITaskScheduler;
class OverlayEnforcer;
class OverlayPlacer;
class OverlayStateStore;
class ToggleCoordinator;

/**
 * @brief Window-command surface of the overlay panel
 *
 * Entry point for the UI layer and the D-Bus adaptor. Each command either
 * succeeds or returns a string naming the platform call that failed.
 */
class TOPNOTE_EXPORT OverlayController : public QObject
{
    Q_OBJECT

public:
    OverlayController(IWindowOverlayDriver* driver, OverlayStateStore* state, const OverlayEnforcer* enforcer,
                      OverlayPlacer* placer, ToggleCoordinator* coordinator, ITaskScheduler* scheduler,
                      QObject* parent = nullptr);
    ~OverlayController() override = default;

    /**
     * @brief Same single-flight toggle as the hotkey
     * @return Failure if a toggle is already in progress
     */
    OperationResult toggle();

    /**
     * @brief Re-assert the overlay configuration and raise the panel
     */
    OperationResult forceToTop();

    OperationResult positionTopRight();

    /**
     * @brief Move the panel frame's top-left corner to @p topLeft
     *
     * Counts as placement, so the first show keeps this position.
     */
    OperationResult moveTo(const QPoint& topLeft);

    /**
     * @brief Move the panel by (@p dx, @p dy) from where it is now
     *
     * Title bar drags go through here: layer surfaces and override-redirect
     * windows cannot start a compositor-driven move.
     */
    Q_INVOKABLE void dragBy(int dx, int dy);

    /**
     * @brief Re-assert the overlay configuration only
     */
    OperationResult ensureTopLevel();

    /**
     * @brief Human-readable report of the live window state
     */
    QString debugInfo() const;

    /**
     * @brief Place the panel once after @p delayMs, off the startup path
     */
    void schedulePlacement(int delayMs);

    bool isVisible() const;

Q_SIGNALS:
    void visibilityChanged(bool visible);

private:
    IWindowOverlayDriver* m_driver = nullptr;
    OverlayStateStore* m_state = nullptr;
    const OverlayEnforcer* m_enforcer = nullptr;
    OverlayPlacer* m_placer = nullptr;
    ToggleCoordinator* m_coordinator = nullptr;
    ITaskScheduler* m_scheduler = nullptr;
};

} // namespace TopNote
