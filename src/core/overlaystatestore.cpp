// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "overlaystatestore.h"
#include "logging.h"

namespace TopNote {

OverlayStateStore::OverlayStateStore(QObject* parent)
    : QObject(parent)
{
}

void OverlayStateStore::setVisibility(VisibilityState state)
{
    if (m_visibility == state) {
        return;
    }
    qCDebug(lcOverlay) << "Visibility" << visibilityStateToString(m_visibility) << "->"
                       << visibilityStateToString(state);
    m_visibility = state;
    Q_EMIT visibilityChanged(state);
}

void OverlayStateStore::setPlaced(bool placed)
{
    m_placed = placed;
}

} // namespace TopNote
