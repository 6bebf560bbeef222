// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "x11overlaydriver.h"
#include "../../core/logging.h"

namespace TopNote {

X11OverlayDriver::X11OverlayDriver(QWindow* window)
    : WindowOverlayDriver(window)
{
}

QString X11OverlayDriver::platformName() const
{
    return QStringLiteral("x11");
}

OperationResult X11OverlayDriver::convertToOverlayPanel()
{
    if (!m_window) {
        return invalidWindow();
    }
    if (m_window->isVisible()) {
        return OperationResult::failure(QStringLiteral("Overlay panel must be converted before it is shown"));
    }

    m_allWorkspaces = true;
    m_nonActivating = true;
    m_level = Defaults::MaxWindowLevel;
    m_collectionBehavior = OverlayConfig::target().collectionBehavior;

    m_window->setFlags(Qt::Tool | Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint
                       | Qt::X11BypassWindowManagerHint);

    qCInfo(lcPlatform) << "Converted window to X11 overlay panel";
    return OperationResult::ok();
}

OperationResult X11OverlayDriver::setAlwaysOnTop(bool onTop)
{
    if (!m_window) {
        return invalidWindow();
    }
    updateFlag(Qt::WindowStaysOnTopHint, onTop);
    return OperationResult::ok();
}

OperationResult X11OverlayDriver::setVisibleOnAllWorkspaces(bool allWorkspaces)
{
    if (!m_window) {
        return invalidWindow();
    }
    m_allWorkspaces = allWorkspaces;
    updateBypassHint();
    return OperationResult::ok();
}

OperationResult X11OverlayDriver::setLevel(int level)
{
    if (!m_window) {
        return invalidWindow();
    }
    if (level < 0) {
        return OperationResult::failure(QStringLiteral("Invalid window level %1").arg(level));
    }

    m_level = level;
    if (level >= Defaults::LayerOverlayThreshold) {
        // Overlay levels only exist in the above-others stacking band
        updateFlag(Qt::WindowStaysOnTopHint, true);
        if (m_window->isVisible()) {
            m_window->raise();
        }
    }
    return OperationResult::ok();
}

OperationResult X11OverlayDriver::setCollectionBehavior(CollectionBehaviors behavior)
{
    if (!m_window) {
        return invalidWindow();
    }
    m_collectionBehavior = behavior;
    updateWindowType(behavior.testFlag(CollectionBehavior::IgnoresCycle) ? Qt::Tool : Qt::Window);
    return OperationResult::ok();
}

OperationResult X11OverlayDriver::setAcceptsMouseEvents(bool accepts)
{
    if (!m_window) {
        return invalidWindow();
    }
    updateFlag(Qt::WindowTransparentForInput, !accepts);
    return OperationResult::ok();
}

OperationResult X11OverlayDriver::setNonActivating(bool nonActivating)
{
    if (!m_window) {
        return invalidWindow();
    }
    m_nonActivating = nonActivating;
    updateBypassHint();
    return OperationResult::ok();
}

OverlayConfig X11OverlayDriver::currentConfig() const
{
    OverlayConfig config;
    if (!m_window) {
        config.alwaysOnTop = false;
        config.allWorkspaces = false;
        config.level = 0;
        config.nonActivating = false;
        config.collectionBehavior = CollectionBehavior::None;
        config.acceptsMouseEvents = false;
        return config;
    }

    const Qt::WindowFlags flags = m_window->flags();
    const bool bypass = flags.testFlag(Qt::X11BypassWindowManagerHint);
    config.alwaysOnTop = flags.testFlag(Qt::WindowStaysOnTopHint);
    config.allWorkspaces = bypass && m_allWorkspaces;
    config.level = config.alwaysOnTop ? m_level : 0;
    config.nonActivating = bypass && m_nonActivating;
    config.collectionBehavior = m_collectionBehavior;
    if (m_window->type() != Qt::Tool) {
        config.collectionBehavior.setFlag(CollectionBehavior::IgnoresCycle, false);
    }
    config.acceptsMouseEvents = !flags.testFlag(Qt::WindowTransparentForInput);
    return config;
}

QPoint X11OverlayDriver::position() const
{
    return m_window ? m_window->framePosition() : QPoint();
}

OperationResult X11OverlayDriver::setPosition(const QPoint& topLeft)
{
    if (!m_window) {
        return invalidWindow();
    }
    m_window->setFramePosition(topLeft);
    return OperationResult::ok();
}

void X11OverlayDriver::updateBypassHint()
{
    updateFlag(Qt::X11BypassWindowManagerHint, m_allWorkspaces || m_nonActivating);
}

void X11OverlayDriver::updateWindowType(Qt::WindowType type)
{
    const Qt::WindowFlags current = m_window->flags();
    const Qt::WindowFlags wanted = (current & ~Qt::WindowType_Mask) | type;
    if (wanted != current) {
        qCDebug(lcPlatform) << "Changing window type to" << type;
        m_window->setFlags(wanted);
    }
}

} // namespace TopNote
