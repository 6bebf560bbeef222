// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <QDBusAbstractAdaptor>
#include <QString>

namespace TopNote {

class OverlayController;

/**
 * @brief D-Bus adaptor for the overlay window commands
 *
 * Provides D-Bus interface: org.topnote.Overlay
 *
 * Command methods return an empty string on success and the error text
 * otherwise, so scripts can call them without decoding D-Bus errors.
 */
class OverlayAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.topnote.Overlay")

public:
    explicit OverlayAdaptor(OverlayController* controller, QObject* parent = nullptr);
    ~OverlayAdaptor() override = default;

public Q_SLOTS:
    QString toggle();
    QString forceToTop();
    QString positionTopRight();
    QString moveTo(int x, int y);
    QString ensureTopLevel();
    QString debugInfo();
    bool isOverlayVisible();

Q_SIGNALS:
    void overlayVisibilityChanged(bool visible);

private:
    OverlayController* m_controller;
};

} // namespace TopNote
