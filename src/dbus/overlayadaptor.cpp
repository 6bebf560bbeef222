// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "overlayadaptor.h"
#include "../core/logging.h"
#include "../core/overlaycontroller.h"

namespace TopNote {

namespace {
QString toReply(const OperationResult& result, const char* method)
{
    if (!result) {
        qCDebug(lcDbus) << method << "failed:" << result.errorMessage;
        return result.errorMessage;
    }
    return QString();
}
} // namespace

OverlayAdaptor::OverlayAdaptor(OverlayController* controller, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_controller(controller)
{
    Q_ASSERT(controller);

    connect(m_controller, &OverlayController::visibilityChanged, this, &OverlayAdaptor::overlayVisibilityChanged);
}

QString OverlayAdaptor::toggle()
{
    return toReply(m_controller->toggle(), "toggle");
}

QString OverlayAdaptor::forceToTop()
{
    return toReply(m_controller->forceToTop(), "forceToTop");
}

QString OverlayAdaptor::positionTopRight()
{
    return toReply(m_controller->positionTopRight(), "positionTopRight");
}

QString OverlayAdaptor::moveTo(int x, int y)
{
    return toReply(m_controller->moveTo(QPoint(x, y)), "moveTo");
}

QString OverlayAdaptor::ensureTopLevel()
{
    return toReply(m_controller->ensureTopLevel(), "ensureTopLevel");
}

QString OverlayAdaptor::debugInfo()
{
    return m_controller->debugInfo();
}

bool OverlayAdaptor::isOverlayVisible()
{
    return m_controller->isVisible();
}

} // namespace TopNote
