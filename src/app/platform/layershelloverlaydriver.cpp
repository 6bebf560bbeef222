// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layershelloverlaydriver.h"
#include "../../core/logging.h"
#include <QGuiApplication>
#include <QMargins>
#include <QScreen>
#include <LayerShellQt/Window>

namespace TopNote {

LayerShellOverlayDriver::LayerShellOverlayDriver(QWindow* window)
    : WindowOverlayDriver(window)
{
}

QString LayerShellOverlayDriver::platformName() const
{
    return QStringLiteral("wayland");
}

LayerShellQt::Window* LayerShellOverlayDriver::layerWindow() const
{
    if (!m_window || !m_converted) {
        return nullptr;
    }
    return LayerShellQt::Window::get(m_window);
}

OperationResult LayerShellOverlayDriver::notConverted() const
{
    if (!m_window) {
        return invalidWindow();
    }
    return OperationResult::failure(QStringLiteral("Window has not been converted to a layer-shell panel"));
}

OperationResult LayerShellOverlayDriver::convertToOverlayPanel()
{
    if (!m_window) {
        return invalidWindow();
    }
    if (m_window->isVisible()) {
        // Layer role is assigned when the surface is created
        return OperationResult::failure(QStringLiteral("Overlay panel must be converted before it is shown"));
    }

    m_window->setFlags(m_window->flags() | Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint);

    auto* layer = LayerShellQt::Window::get(m_window);
    if (!layer) {
        return OperationResult::failure(QStringLiteral("Compositor does not support wlr-layer-shell"));
    }

    layer->setLayer(LayerShellQt::Window::LayerOverlay);
    layer->setKeyboardInteractivity(LayerShellQt::Window::KeyboardInteractivityOnDemand);
    layer->setAnchors(LayerShellQt::Window::Anchors(LayerShellQt::Window::AnchorTop | LayerShellQt::Window::AnchorLeft));
    layer->setExclusiveZone(-1);
    layer->setScope(QStringLiteral("topnote-panel"));
    if (QScreen* primary = QGuiApplication::primaryScreen()) {
        layer->setScreen(primary);
        m_position = primary->geometry().topLeft();
    }

    m_converted = true;
    m_alwaysOnTop = true;
    m_level = Defaults::MaxWindowLevel;
    m_collectionBehavior = OverlayConfig::target().collectionBehavior;

    qCInfo(lcPlatform) << "Converted window to layer-shell overlay panel";
    return OperationResult::ok();
}

void LayerShellOverlayDriver::applyLayer()
{
    auto* layer = layerWindow();
    LayerShellQt::Window::Layer wanted = LayerShellQt::Window::LayerBottom;
    if (m_alwaysOnTop) {
        wanted = m_level >= Defaults::LayerOverlayThreshold ? LayerShellQt::Window::LayerOverlay
                                                            : LayerShellQt::Window::LayerTop;
    }
    if (layer->layer() != wanted) {
        qCDebug(lcPlatform) << "Moving overlay to layer" << static_cast<int>(wanted);
        layer->setLayer(wanted);
    }
}

OperationResult LayerShellOverlayDriver::setAlwaysOnTop(bool onTop)
{
    if (!layerWindow()) {
        return notConverted();
    }
    m_alwaysOnTop = onTop;
    applyLayer();
    return OperationResult::ok();
}

OperationResult LayerShellOverlayDriver::setVisibleOnAllWorkspaces(bool allWorkspaces)
{
    if (!layerWindow()) {
        return notConverted();
    }
    if (!allWorkspaces) {
        return OperationResult::failure(QStringLiteral("Layer surfaces cannot be bound to a single workspace"));
    }
    return OperationResult::ok();
}

OperationResult LayerShellOverlayDriver::setLevel(int level)
{
    if (!layerWindow()) {
        return notConverted();
    }
    if (level < 0) {
        return OperationResult::failure(QStringLiteral("Invalid window level %1").arg(level));
    }
    m_level = level;
    applyLayer();
    return OperationResult::ok();
}

OperationResult LayerShellOverlayDriver::setCollectionBehavior(CollectionBehaviors behavior)
{
    if (!layerWindow()) {
        return notConverted();
    }
    m_collectionBehavior = behavior;
    return OperationResult::ok();
}

OperationResult LayerShellOverlayDriver::setAcceptsMouseEvents(bool accepts)
{
    if (!layerWindow()) {
        return notConverted();
    }
    updateFlag(Qt::WindowTransparentForInput, !accepts);
    return OperationResult::ok();
}

OperationResult LayerShellOverlayDriver::setNonActivating(bool nonActivating)
{
    auto* layer = layerWindow();
    if (!layer) {
        return notConverted();
    }
    const auto wanted = nonActivating ? LayerShellQt::Window::KeyboardInteractivityOnDemand
                                      : LayerShellQt::Window::KeyboardInteractivityExclusive;
    if (layer->keyboardInteractivity() != wanted) {
        layer->setKeyboardInteractivity(wanted);
    }
    return OperationResult::ok();
}

OverlayConfig LayerShellOverlayDriver::currentConfig() const
{
    OverlayConfig config;
    auto* layer = layerWindow();
    if (!layer) {
        config.alwaysOnTop = false;
        config.allWorkspaces = false;
        config.level = 0;
        config.nonActivating = false;
        config.collectionBehavior = CollectionBehavior::None;
        config.acceptsMouseEvents = m_window && !m_window->flags().testFlag(Qt::WindowTransparentForInput);
        return config;
    }

    const LayerShellQt::Window::Layer current = layer->layer();
    config.alwaysOnTop = current == LayerShellQt::Window::LayerTop || current == LayerShellQt::Window::LayerOverlay;
    config.allWorkspaces = true;
    config.level = config.alwaysOnTop ? m_level : 0;
    config.nonActivating = layer->keyboardInteractivity() != LayerShellQt::Window::KeyboardInteractivityExclusive;
    config.collectionBehavior = m_collectionBehavior;
    config.acceptsMouseEvents = !m_window->flags().testFlag(Qt::WindowTransparentForInput);
    return config;
}

QSize LayerShellOverlayDriver::outerSize() const
{
    // Layer surfaces are undecorated
    return m_window ? m_window->size() : QSize();
}

QPoint LayerShellOverlayDriver::position() const
{
    return m_position;
}

OperationResult LayerShellOverlayDriver::setPosition(const QPoint& topLeft)
{
    auto* layer = layerWindow();
    if (!layer) {
        return notConverted();
    }

    QScreen* screen = QGuiApplication::screenAt(topLeft);
    if (!screen) {
        screen = QGuiApplication::primaryScreen();
    }
    if (!screen) {
        return OperationResult::failure(QStringLiteral("No screen available for the overlay panel"));
    }

    // Anchored top-left: margins are offsets from the output's origin
    const QPoint local = topLeft - screen->geometry().topLeft();
    layer->setScreen(screen);
    layer->setMargins(QMargins(local.x(), local.y(), 0, 0));
    m_position = topLeft;
    qCDebug(lcPlatform) << "Layer-shell margins on" << screen->name() << ":" << local;
    return OperationResult::ok();
}

} // namespace TopNote
