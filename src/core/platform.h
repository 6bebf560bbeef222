// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "topnote_export.h"
#include <QString>

namespace TopNote {

/**
 * @brief Display server detection
 *
 * Selects the overlay driver at startup: layer-shell on Wayland,
 * window-manager hints on X11.
 */
namespace Platform {

/**
 * @brief Check if the panel talks to a Wayland compositor
 *
 * Once a QGuiApplication exists only its platform plugin counts. Before
 * that, WAYLAND_DISPLAY and XDG_SESSION_TYPE are used as a guess.
 */
TOPNOTE_EXPORT bool isWayland();

/**
 * @brief Check if the panel talks to an X server (xcb plugin, XWayland included)
 */
TOPNOTE_EXPORT bool isX11();

/**
 * @brief Get the display server name
 * @return "wayland", "x11", or "unknown"
 */
TOPNOTE_EXPORT QString displayServer();

} // namespace Platform

} // namespace TopNote
