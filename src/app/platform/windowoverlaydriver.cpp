// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowoverlaydriver.h"
#include "../../core/logging.h"
#include <QGuiApplication>
#include <QScreen>

namespace TopNote {

WindowOverlayDriver::WindowOverlayDriver(QWindow* window)
    : m_window(window)
{
}

WindowOverlayDriver::~WindowOverlayDriver() = default;

OperationResult WindowOverlayDriver::invalidWindow()
{
    return OperationResult::failure(QStringLiteral("Window handle is no longer valid"));
}

bool WindowOverlayDriver::isValid() const
{
    return !m_window.isNull();
}

bool WindowOverlayDriver::isVisible() const
{
    return m_window && m_window->isVisible();
}

OperationResult WindowOverlayDriver::show()
{
    if (!m_window) {
        return invalidWindow();
    }
    m_window->show();
    return OperationResult::ok();
}

OperationResult WindowOverlayDriver::hide()
{
    if (!m_window) {
        return invalidWindow();
    }
    m_window->hide();
    return OperationResult::ok();
}

OperationResult WindowOverlayDriver::raise()
{
    if (!m_window) {
        return invalidWindow();
    }
    if (!m_window->isVisible()) {
        return OperationResult::failure(QStringLiteral("Cannot raise a hidden window"));
    }
    m_window->raise();
    return OperationResult::ok();
}

QSize WindowOverlayDriver::outerSize() const
{
    if (!m_window) {
        return QSize();
    }
    // frameGeometry includes decorations; identical to size() for frameless panels
    return m_window->frameGeometry().size();
}

QVector<QRect> WindowOverlayDriver::monitorGeometries() const
{
    QVector<QRect> geometries;
    QScreen* primary = QGuiApplication::primaryScreen();
    if (!primary) {
        return geometries;
    }

    geometries.append(primary->geometry());
    const auto screens = QGuiApplication::screens();
    for (QScreen* screen : screens) {
        if (screen != primary) {
            geometries.append(screen->geometry());
        }
    }
    return geometries;
}

void WindowOverlayDriver::updateFlag(Qt::WindowType flag, bool on)
{
    const Qt::WindowFlags current = m_window->flags();
    const Qt::WindowFlags wanted = on ? (current | flag) : (current & ~Qt::WindowFlags(flag));
    if (wanted != current) {
        qCDebug(lcPlatform) << "Updating window flags" << current << "->" << wanted;
        m_window->setFlags(wanted);
    }
}

} // namespace TopNote
