// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "placement.h"

namespace TopNote {

namespace Placement {

QPoint computeTopRight(const QRect& screen, const QSize& window, int marginX, int marginY)
{
    const int x = screen.x() + screen.width() - window.width() - marginX;
    const int y = screen.y() + marginY;
    return QPoint(x, y);
}

PlacementResult computeTopRight(const QVector<QRect>& monitors, const QSize& window, int marginX, int marginY)
{
    PlacementResult result;
    if (monitors.isEmpty()) {
        result.error = PlacementError::NoMonitorFound;
        return result;
    }

    result.position = computeTopRight(monitors.first(), window, marginX, marginY);
    return result;
}

} // namespace Placement

} // namespace TopNote
