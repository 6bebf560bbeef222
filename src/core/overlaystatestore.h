// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "topnote_export.h"
#include "types.h"
#include <QObject>

namespace TopNote {

/**
 * @brief Intended visibility of the overlay panel
 *
 * Single writer: only ToggleCoordinator changes visibility and only
 * OverlayPlacer marks the panel as placed. Readers (D-Bus, debug output)
 * live on the same GUI thread.
 */
class TOPNOTE_EXPORT OverlayStateStore : public QObject
{
    Q_OBJECT

public:
    explicit OverlayStateStore(QObject* parent = nullptr);
    ~OverlayStateStore() override = default;

    VisibilityState visibility() const
    {
        return m_visibility;
    }
    void setVisibility(VisibilityState state);

    bool isVisible() const
    {
        return m_visibility == VisibilityState::Visible;
    }

    bool hasBeenPlaced() const
    {
        return m_placed;
    }
    void setPlaced(bool placed);

Q_SIGNALS:
    void visibilityChanged(VisibilityState state);

private:
    VisibilityState m_visibility = VisibilityState::Hidden;
    bool m_placed = false;
};

} // namespace TopNote
