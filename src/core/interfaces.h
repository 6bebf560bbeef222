// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "topnote_export.h"
#include "types.h"
#include <QPoint>
#include <QRect>
#include <QSize>
#include <QString>
#include <QVector>
#include <functional>

namespace TopNote {

/**
 * @brief Capability interface over the native overlay window
 *
 * One implementation per display server (LayerShellOverlayDriver on Wayland,
 * X11OverlayDriver on X11). The coordinator, enforcer and placer depend only
 * on this interface, never on platform types.
 *
 * The driver does not own the window. Once the window is destroyed isValid()
 * returns false and every mutating call fails with an error message.
 */
class TOPNOTE_EXPORT IWindowOverlayDriver
{
public:
    virtual ~IWindowOverlayDriver();

    /**
     * @brief Display server name reported in debug output ("wayland", "x11")
     */
    virtual QString platformName() const = 0;

    virtual bool isValid() const = 0;
    virtual bool isVisible() const = 0;

    /**
     * @brief Turn the window into a non-activating overlay panel
     *
     * Called once, before the window is first shown. Properties set here are
     * later re-asserted through the individual setters, never re-converted.
     */
    virtual OperationResult convertToOverlayPanel() = 0;

    virtual OperationResult show() = 0;
    virtual OperationResult hide() = 0;
    virtual OperationResult raise() = 0;

    // Overlay properties re-asserted by OverlayEnforcer
    virtual OperationResult setAlwaysOnTop(bool onTop) = 0;
    virtual OperationResult setVisibleOnAllWorkspaces(bool allWorkspaces) = 0;
    virtual OperationResult setLevel(int level) = 0;
    virtual OperationResult setCollectionBehavior(CollectionBehaviors behavior) = 0;
    virtual OperationResult setAcceptsMouseEvents(bool accepts) = 0;
    virtual OperationResult setNonActivating(bool nonActivating) = 0;

    /**
     * @brief Live overlay configuration as currently reported by the window
     */
    virtual OverlayConfig currentConfig() const = 0;

    // Geometry, queried fresh every time (monitors can be hot-plugged)
    virtual QSize outerSize() const = 0;

    /**
     * @brief Geometry of every connected monitor, primary first
     * @return Empty when no monitor is available
     */
    virtual QVector<QRect> monitorGeometries() const = 0;

    /**
     * @brief Top-left of the window frame in global coordinates
     */
    virtual QPoint position() const = 0;
    virtual OperationResult setPosition(const QPoint& topLeft) = 0;
};

/**
 * @brief Submission point for deferred work
 *
 * Toggle sequences suspend only through this interface (settle delay, retry
 * spacing, cooldown), so tests can drive them with a virtual clock instead
 * of wall-clock time.
 */
class TOPNOTE_EXPORT ITaskScheduler
{
public:
    using Task = std::function<void()>;

    virtual ~ITaskScheduler();

    /**
     * @brief Run @p task after @p delayMs milliseconds (0 = next event loop pass)
     */
    virtual void schedule(int delayMs, Task task) = 0;

    /**
     * @brief Monotonic milliseconds since the scheduler was created
     */
    virtual qint64 elapsedMs() const = 0;
};

} // namespace TopNote
