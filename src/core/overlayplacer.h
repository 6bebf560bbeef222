// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "constants.h"
#include "topnote_export.h"
#include "types.h"

namespace TopNote {

class IWindowOverlayDriver;
class OverlayStateStore;

/**
 * @brief Moves the panel to the top-right corner of the primary monitor
 *
 * Queries the monitor set and the window size at call time and feeds them
 * to Placement::computeTopRight(). With no monitor the placement is skipped
 * and the window stays wherever it was last shown.
 */
class TOPNOTE_EXPORT OverlayPlacer
{
public:
    OverlayPlacer(IWindowOverlayDriver* driver, OverlayStateStore* state);

    void setMargins(int marginX, int marginY);
    int marginX() const
    {
        return m_marginX;
    }
    int marginY() const
    {
        return m_marginY;
    }

    OperationResult positionTopRight();

private:
    IWindowOverlayDriver* m_driver = nullptr;
    OverlayStateStore* m_state = nullptr;
    int m_marginX = Defaults::PlacementMarginX;
    int m_marginY = Defaults::PlacementMarginY;
};

} // namespace TopNote
