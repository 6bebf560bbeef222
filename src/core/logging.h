// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "topnote_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for TopNote
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcToggle) << "Debug message";
 *   qCWarning(lcOverlay) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="topnote.*=true"                 # Enable all
 *   QT_LOGGING_RULES="topnote.*.debug=false"          # Disable debug only
 *   QT_LOGGING_RULES="topnote.core.toggle.debug=true" # Trace toggle sequences
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing, disabled in release builds
 *   qCInfo     - Significant operational events (startup, overlay shown/hidden)
 *   qCWarning  - Recoverable errors, failed platform calls, missing resources
 *   qCCritical - Startup failures preventing normal operation
 */

namespace TopNote {

// Core module - overlay state, toggling, placement, notes
TOPNOTE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcOverlay)
TOPNOTE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcToggle)
TOPNOTE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcPlacement)
TOPNOTE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcNotes)

// Application module - bootstrap, shortcuts, platform drivers
TOPNOTE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcApp)
TOPNOTE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcShortcuts)
TOPNOTE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcPlatform)

// D-Bus module - command surface adaptors
TOPNOTE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDbus)

// Configuration module - settings loading/saving
TOPNOTE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace TopNote
