// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"

namespace TopNote {

QString visibilityStateToString(VisibilityState state)
{
    switch (state) {
    case VisibilityState::Hidden:
        return QStringLiteral("Hidden");
    case VisibilityState::Showing:
        return QStringLiteral("Showing");
    case VisibilityState::Visible:
        return QStringLiteral("Visible");
    }
    return QStringLiteral("Unknown");
}

} // namespace TopNote
