// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../../core/interfaces.h"
#include <QPointer>
#include <QWindow>

namespace TopNote {

/**
 * @brief Shared part of the Qt-window backed overlay drivers
 *
 * Tracks the window through a QPointer, so a destroyed window turns every
 * call into a "no longer valid" failure instead of a dangling access.
 * Visibility, stacking order and monitor queries are the same on every
 * display server; the overlay properties are left to the subclasses.
 */
class WindowOverlayDriver : public IWindowOverlayDriver
{
public:
    explicit WindowOverlayDriver(QWindow* window);
    ~WindowOverlayDriver() override;

    bool isValid() const override;
    bool isVisible() const override;

    OperationResult show() override;
    OperationResult hide() override;
    OperationResult raise() override;

    QSize outerSize() const override;
    QVector<QRect> monitorGeometries() const override;

    QWindow* window() const
    {
        return m_window.data();
    }

protected:
    static OperationResult invalidWindow();

    /**
     * @brief Set or clear one window flag, touching the window only on change
     *
     * Re-setting identical flags on a mapped X11 window makes Qt unmap and
     * remap it, which shows up as flicker on every enforcement pass.
     */
    void updateFlag(Qt::WindowType flag, bool on);

    QPointer<QWindow> m_window;
};

} // namespace TopNote
