// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "windowoverlaydriver.h"

namespace LayerShellQt {
class Window;
}

namespace TopNote {

/**
 * @brief Overlay driver for Wayland sessions, backed by wlr-layer-shell
 *
 * Wayland clients cannot stack themselves above other windows; a layer
 * surface can. The mapping from overlay properties to layer-shell state:
 * - always on top + level >= Defaults::LayerOverlayThreshold: LayerOverlay
 *   (above fullscreen windows), otherwise LayerTop; not on top: LayerBottom
 * - non-activating: KeyboardInteractivityOnDemand (focus only on click)
 * - ignores mouse events: empty input region (Qt::WindowTransparentForInput)
 * - all workspaces, cycle exclusion and fullscreen auxiliary are inherent to
 *   layer surfaces and only recorded
 *
 * Position is expressed as top/left margins on the output containing the point.
 */
class LayerShellOverlayDriver : public WindowOverlayDriver
{
public:
    explicit LayerShellOverlayDriver(QWindow* window);

    QString platformName() const override;

    OperationResult convertToOverlayPanel() override;

    OperationResult setAlwaysOnTop(bool onTop) override;
    OperationResult setVisibleOnAllWorkspaces(bool allWorkspaces) override;
    OperationResult setLevel(int level) override;
    OperationResult setCollectionBehavior(CollectionBehaviors behavior) override;
    OperationResult setAcceptsMouseEvents(bool accepts) override;
    OperationResult setNonActivating(bool nonActivating) override;

    OverlayConfig currentConfig() const override;

    QSize outerSize() const override;
    QPoint position() const override;
    OperationResult setPosition(const QPoint& topLeft) override;

private:
    /**
     * @brief Layer-shell handle of the window, nullptr before conversion or after destruction
     */
    LayerShellQt::Window* layerWindow() const;
    OperationResult notConverted() const;
    void applyLayer();

    bool m_converted = false;
    bool m_alwaysOnTop = false;
    int m_level = 0;
    CollectionBehaviors m_collectionBehavior = CollectionBehavior::None;

    // Qt does not track where the compositor put a layer surface
    QPoint m_position;
};

} // namespace TopNote
