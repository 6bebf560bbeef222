// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "windowoverlaydriver.h"

namespace TopNote {

/**
 * @brief Overlay driver for X11 sessions
 *
 * X11 has no numeric stacking levels, so the overlay is expressed through
 * window-manager hints:
 * - always on top: _NET_WM_STATE_ABOVE (Qt::WindowStaysOnTopHint)
 * - all workspaces / non-activating: override-redirect
 *   (Qt::X11BypassWindowManagerHint). The window manager neither pins it to
 *   a desktop nor focuses it; the panel takes focus explicitly on click.
 * - excluded from window cycling: Qt::Tool window type
 *
 * The requested level is remembered and reported while the window stays on top.
 */
class X11OverlayDriver : public WindowOverlayDriver
{
public:
    explicit X11OverlayDriver(QWindow* window);

    QString platformName() const override;

    OperationResult convertToOverlayPanel() override;

    OperationResult setAlwaysOnTop(bool onTop) override;
    OperationResult setVisibleOnAllWorkspaces(bool allWorkspaces) override;
    OperationResult setLevel(int level) override;
    OperationResult setCollectionBehavior(CollectionBehaviors behavior) override;
    OperationResult setAcceptsMouseEvents(bool accepts) override;
    OperationResult setNonActivating(bool nonActivating) override;

    OverlayConfig currentConfig() const override;

    QPoint position() const override;
    OperationResult setPosition(const QPoint& topLeft) override;

private:
    void updateBypassHint();
    void updateWindowType(Qt::WindowType type);

    bool m_allWorkspaces = false;
    bool m_nonActivating = false;
    int m_level = 0;
    CollectionBehaviors m_collectionBehavior = CollectionBehavior::None;
};

} // namespace TopNote
