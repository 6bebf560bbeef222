// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "topnoteconfig.h" // Generated from topnote.kcfg via KConfigXT

#include <QString>

namespace TopNote {

/**
 * @brief Provides static access to default configuration values
 *
 * This class wraps the KConfigXT-generated TopNoteConfig class to provide
 * static access to default values. The .kcfg file is the SINGLE SOURCE OF TRUTH
 * for all defaults - this class simply exposes those generated defaults.
 *
 * Usage:
 *   int margin = ConfigDefaults::marginX();            // Returns 20 (from .kcfg)
 *   QString keys = ConfigDefaults::toggleOverlayShortcut(); // "Meta+Shift+`"
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Global Shortcuts
    // ═══════════════════════════════════════════════════════════════════════════

    static QString toggleOverlayShortcut() { return instance().defaultToggleOverlayShortcutValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Placement Settings
    // ═══════════════════════════════════════════════════════════════════════════

    static int marginX() { return instance().defaultMarginXValue(); }
    static int marginY() { return instance().defaultMarginYValue(); }
    static bool positionOnStartup() { return instance().defaultPositionOnStartupValue(); }

private:
    // Lazily-initialized singleton instance
    static TopNoteConfig& instance()
    {
        static TopNoteConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace TopNote
