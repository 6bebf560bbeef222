// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace TopNote {

// Core module categories
Q_LOGGING_CATEGORY(lcOverlay, "topnote.core.overlay", QtInfoMsg)
Q_LOGGING_CATEGORY(lcToggle, "topnote.core.toggle", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPlacement, "topnote.core.placement", QtInfoMsg)
Q_LOGGING_CATEGORY(lcNotes, "topnote.core.notes", QtInfoMsg)

// Application module categories
Q_LOGGING_CATEGORY(lcApp, "topnote.app", QtInfoMsg)
Q_LOGGING_CATEGORY(lcShortcuts, "topnote.app.shortcuts", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPlatform, "topnote.platform", QtInfoMsg)

// D-Bus module categories
Q_LOGGING_CATEGORY(lcDbus, "topnote.dbus", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "topnote.config", QtInfoMsg)

} // namespace TopNote
