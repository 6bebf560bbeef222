// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>
#include <limits>

namespace TopNote {

/**
 * @brief Timing and geometry constants for the overlay panel
 *
 * The pacing delays are fixed on purpose and are NOT in topnote.kcfg.
 * For user-configurable settings, see ConfigDefaults and topnote.kcfg.
 */
namespace Defaults {
// Highest stacking level a window can request (renders above fullscreen surfaces)
constexpr int MaxWindowLevel = std::numeric_limits<int>::max();
// Levels at or above this map to the Wayland overlay layer
constexpr int LayerOverlayThreshold = 1000;

// Toggle sequence pacing
constexpr int SettleDelayMs = 50; // Let the compositor map the window before re-asserting
constexpr int EnforcementAttempts = 3;
constexpr int EnforcementRetryIntervalMs = 25;
constexpr int ToggleCooldownMs = 200; // Measured from trigger receipt

// Startup
constexpr int StartupPlacementDelayMs = 100;

// Placement margins (configurable via Settings, these are the fallbacks)
constexpr int PlacementMarginX = 20;
constexpr int PlacementMarginY = 40;
constexpr int MaxPlacementMargin = 10000;

// Notes
constexpr int AutosaveDelayMs = 500;
inline constexpr QLatin1String NotesFileName{"notes.txt"};
}

namespace DBus {
inline constexpr QLatin1String ServiceName{"org.topnote"};
inline constexpr QLatin1String ObjectPath{"/TopNote"};

namespace Interface {
inline constexpr QLatin1String Overlay{"org.topnote.Overlay"};
inline constexpr QLatin1String Notes{"org.topnote.Notes"};
}
}

} // namespace TopNote
