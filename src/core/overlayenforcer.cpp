// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "overlayenforcer.h"
#include "interfaces.h"
#include "logging.h"

namespace TopNote {

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Macros
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Run one driver call and bail out with a labelled error on failure
 * @param label Name of the platform operation for the error message
 * @param call Driver call returning OperationResult
 */
#define ENFORCE_STEP(label, call) \
    do { \
        const OperationResult stepResult = (call); \
        if (!stepResult) { \
            return OperationResult::failure( \
                QStringLiteral("%1 failed: %2").arg(QStringLiteral(label), stepResult.errorMessage)); \
        } \
    } while (0)

OverlayEnforcer::OverlayEnforcer(const OverlayConfig& target)
    : m_target(target)
{
}

OperationResult OverlayEnforcer::enforce(IWindowOverlayDriver* driver) const
{
    if (!driver || !driver->isValid()) {
        return OperationResult::failure(QStringLiteral("Window handle is no longer valid"));
    }

    ENFORCE_STEP("setAlwaysOnTop", driver->setAlwaysOnTop(m_target.alwaysOnTop));
    ENFORCE_STEP("setVisibleOnAllWorkspaces", driver->setVisibleOnAllWorkspaces(m_target.allWorkspaces));
    ENFORCE_STEP("setLevel", driver->setLevel(m_target.level));
    ENFORCE_STEP("setCollectionBehavior", driver->setCollectionBehavior(m_target.collectionBehavior));
    ENFORCE_STEP("setAcceptsMouseEvents", driver->setAcceptsMouseEvents(m_target.acceptsMouseEvents));
    ENFORCE_STEP("setNonActivating", driver->setNonActivating(m_target.nonActivating));

    qCDebug(lcOverlay) << "Applied overlay configuration on" << driver->platformName() << "level" << m_target.level;
    return OperationResult::ok();
}

#undef ENFORCE_STEP

} // namespace TopNote
