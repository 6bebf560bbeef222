// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../../core/interfaces.h"
#include <memory>

class QWindow;

namespace TopNote {

/**
 * @brief Create the overlay driver for the running display server
 * @return nullptr if the display server is neither Wayland nor X11
 */
std::unique_ptr<IWindowOverlayDriver> createOverlayDriver(QWindow* window);

} // namespace TopNote
