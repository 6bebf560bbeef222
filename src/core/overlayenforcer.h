// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "topnote_export.h"
#include "types.h"

namespace TopNote {

class IWindowOverlayDriver;

/**
 * @brief Re-applies the overlay configuration to the panel window
 *
 * enforce() is idempotent: it can be called any number of times in any
 * visibility state and always drives the window toward target(). It sets,
 * in order:
 * - always-on-top and visible-on-all-workspaces
 * - the maximum stacking level (above fullscreen applications)
 * - join-all-spaces / fullscreen-auxiliary / stationary / ignores-cycle
 * - mouse input accepted, keyboard activation refused on show
 *
 * The first failing platform call is reported and the remaining calls are
 * skipped. Retrying is the caller's job (see ToggleCoordinator).
 */
class TOPNOTE_EXPORT OverlayEnforcer
{
public:
    explicit OverlayEnforcer(const OverlayConfig& target = OverlayConfig::target());

    OperationResult enforce(IWindowOverlayDriver* driver) const;

    const OverlayConfig& target() const
    {
        return m_target;
    }

private:
    OverlayConfig m_target;
};

} // namespace TopNote
