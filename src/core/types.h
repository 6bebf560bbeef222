// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "constants.h"
#include "topnote_export.h"
#include <QFlags>
#include <QString>

namespace TopNote {

/**
 * @brief Lifecycle of the overlay panel's visibility
 *
 * Starts Hidden. Showing is transient while the show sequence runs its
 * enforcement attempts; Visible once they complete. Hide goes straight
 * from Visible to Hidden.
 */
enum class VisibilityState {
    Hidden = 0,
    Showing = 1,
    Visible = 2
};

TOPNOTE_EXPORT QString visibilityStateToString(VisibilityState state);

/**
 * @brief Workspace/stacking behaviors the panel requests from the window system
 */
enum class CollectionBehavior {
    None = 0,
    CanJoinAllSpaces = 1 << 0, ///< Present on every virtual desktop
    FullScreenAuxiliary = 1 << 1, ///< May share the screen with a fullscreen window
    Stationary = 1 << 2, ///< Not reordered or moved on desktop switches
    IgnoresCycle = 1 << 3 ///< Excluded from Alt+Tab style window cycling
};
Q_DECLARE_FLAGS(CollectionBehaviors, CollectionBehavior)
Q_DECLARE_OPERATORS_FOR_FLAGS(CollectionBehaviors)

/**
 * @brief OS-level configuration of the overlay window
 *
 * The live state of a visible panel must equal OverlayConfig::target().
 * Window systems revoke parts of it (new desktop, fullscreen transition,
 * focus change), so it is re-asserted rather than applied once.
 */
struct OverlayConfig {
    bool alwaysOnTop = true;
    bool allWorkspaces = true;
    int level = Defaults::MaxWindowLevel;
    bool nonActivating = true;
    CollectionBehaviors collectionBehavior = CollectionBehavior::CanJoinAllSpaces
        | CollectionBehavior::FullScreenAuxiliary | CollectionBehavior::Stationary | CollectionBehavior::IgnoresCycle;
    bool acceptsMouseEvents = true;

    static OverlayConfig target()
    {
        return OverlayConfig{};
    }

    bool operator==(const OverlayConfig& other) const = default;
};

/**
 * @brief Outcome of a platform call or window command
 *
 * errorMessage describes the failing call and is what the window-command
 * surface hands back to its caller.
 */
struct OperationResult {
    bool success = true;
    QString errorMessage;

    static OperationResult ok()
    {
        return OperationResult{};
    }

    static OperationResult failure(const QString& message)
    {
        return OperationResult{false, message};
    }

    explicit operator bool() const
    {
        return success;
    }
};

} // namespace TopNote
