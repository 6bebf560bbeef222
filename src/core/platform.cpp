// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "platform.h"
#include <QGuiApplication>

namespace TopNote {

namespace Platform {

namespace {

// Environment guess for callers that run before the QGuiApplication exists
bool sessionLooksLikeWayland()
{
    if (!qEnvironmentVariableIsEmpty("WAYLAND_DISPLAY")) {
        return true;
    }
    return qEnvironmentVariable("XDG_SESSION_TYPE").compare(QLatin1String("wayland"), Qt::CaseInsensitive) == 0;
}

} // namespace

bool isWayland()
{
    // QT_QPA_PLATFORM=xcb inside a Wayland session runs through XWayland,
    // where layer-shell is unavailable. The loaded plugin is authoritative.
    if (qGuiApp) {
        return QGuiApplication::platformName().startsWith(QLatin1String("wayland"), Qt::CaseInsensitive);
    }
    return sessionLooksLikeWayland();
}

bool isX11()
{
    if (qGuiApp) {
        return QGuiApplication::platformName() == QLatin1String("xcb");
    }
    return !qEnvironmentVariableIsEmpty("DISPLAY") && !sessionLooksLikeWayland();
}

QString displayServer()
{
    if (isWayland()) {
        return QStringLiteral("wayland");
    }
    if (isX11()) {
        return QStringLiteral("x11");
    }
    return QStringLiteral("unknown");
}

} // namespace Platform

} // namespace TopNote
