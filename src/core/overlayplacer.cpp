// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "overlayplacer.h"
#include "interfaces.h"
#include "logging.h"
#include "overlaystatestore.h"
#include "placement.h"

namespace TopNote {

OverlayPlacer::OverlayPlacer(IWindowOverlayDriver* driver, OverlayStateStore* state)
    : m_driver(driver)
    , m_state(state)
{
    Q_ASSERT(driver);
    Q_ASSERT(state);
}

void OverlayPlacer::setMargins(int marginX, int marginY)
{
    m_marginX = marginX;
    m_marginY = marginY;
}

OperationResult OverlayPlacer::positionTopRight()
{
    if (!m_driver->isValid()) {
        return OperationResult::failure(QStringLiteral("Window handle is no longer valid"));
    }

    const QSize windowSize = m_driver->outerSize();
    const Placement::PlacementResult placement =
        Placement::computeTopRight(m_driver->monitorGeometries(), windowSize, m_marginX, m_marginY);
    if (placement.error == Placement::PlacementError::NoMonitorFound) {
        qCWarning(lcPlacement) << "No primary monitor found, keeping current position";
        return OperationResult::failure(QStringLiteral("No primary monitor found"));
    }

    const OperationResult moved = m_driver->setPosition(placement.position);
    if (!moved) {
        qCWarning(lcPlacement) << "Failed to move overlay to" << placement.position << ":" << moved.errorMessage;
        return moved;
    }

    m_state->setPlaced(true);
    qCDebug(lcPlacement) << "Placed overlay at" << placement.position << "size" << windowSize;
    return OperationResult::ok();
}

} // namespace TopNote
