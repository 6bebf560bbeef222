// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "overlaydriverfactory.h"
#include "layershelloverlaydriver.h"
#include "x11overlaydriver.h"
#include "../../core/logging.h"
#include "../../core/platform.h"
#include <QGuiApplication>

namespace TopNote {

std::unique_ptr<IWindowOverlayDriver> createOverlayDriver(QWindow* window)
{
    if (Platform::isWayland()) {
        return std::make_unique<LayerShellOverlayDriver>(window);
    }
    if (Platform::isX11()) {
        return std::make_unique<X11OverlayDriver>(window);
    }

    qCCritical(lcPlatform) << "Unsupported Qt platform plugin:" << QGuiApplication::platformName();
    return nullptr;
}

} // namespace TopNote
