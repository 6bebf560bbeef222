// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "topnote_export.h"
#include <QPoint>
#include <QRect>
#include <QSize>
#include <QVector>

namespace TopNote {

/**
 * @brief Pure placement calculations for the overlay panel
 *
 * No side effects and no caching: callers pass geometry snapshots queried
 * right before placing, since monitors can change between toggles.
 */
namespace Placement {

enum class PlacementError {
    None,
    NoMonitorFound
};

struct PlacementResult {
    QPoint position;
    PlacementError error = PlacementError::None;

    bool isValid() const
    {
        return error == PlacementError::None;
    }
};

/**
 * @brief Top-left position that puts the window in the screen's top-right corner
 * @param screen Screen geometry
 * @param window Outer size of the window
 * @param marginX Gap between the window's right edge and the screen's right edge
 * @param marginY Gap between the screen's top edge and the window's top edge
 *
 * x = screen.x + screen.width - window.width - marginX
 * y = screen.y + marginY
 */
TOPNOTE_EXPORT QPoint computeTopRight(const QRect& screen, const QSize& window, int marginX, int marginY);

/**
 * @brief Top-right placement on the primary monitor
 * @param monitors Monitor geometries, primary first
 * @return NoMonitorFound when @p monitors is empty
 */
TOPNOTE_EXPORT PlacementResult computeTopRight(const QVector<QRect>& monitors, const QSize& window, int marginX,
                                               int marginY);

} // namespace Placement

} // namespace TopNote
