// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/constants.h"
#include "topnote_export.h"
#include <QObject>
#include <QString>

class KConfigGroup;

namespace TopNote {

/**
 * @brief User settings for TopNote
 *
 * Backed by KConfig (topnoterc). Defaults come from topnote.kcfg through
 * ConfigDefaults. Out-of-range values read from disk fall back to the
 * default; values set at runtime are clamped.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class TOPNOTE_EXPORT Settings : public QObject
{
    Q_OBJECT

    // Global Shortcuts (registered with KGlobalAccel)
    Q_PROPERTY(QString toggleOverlayShortcut READ toggleOverlayShortcut WRITE setToggleOverlayShortcut NOTIFY
                   toggleOverlayShortcutChanged)

    // Placement
    Q_PROPERTY(int placementMarginX READ placementMarginX WRITE setPlacementMarginX NOTIFY placementMarginXChanged)
    Q_PROPERTY(int placementMarginY READ placementMarginY WRITE setPlacementMarginY NOTIFY placementMarginYChanged)
    Q_PROPERTY(bool positionOnStartup READ positionOnStartup WRITE setPositionOnStartup NOTIFY
                   positionOnStartupChanged)

public:
    explicit Settings(QObject* parent = nullptr);
    ~Settings() override = default;

    QString toggleOverlayShortcut() const
    {
        return m_toggleOverlayShortcut;
    }
    void setToggleOverlayShortcut(const QString& shortcut);

    int placementMarginX() const
    {
        return m_placementMarginX;
    }
    void setPlacementMarginX(int margin);

    int placementMarginY() const
    {
        return m_placementMarginY;
    }
    void setPlacementMarginY(int margin);

    bool positionOnStartup() const
    {
        return m_positionOnStartup;
    }
    void setPositionOnStartup(bool enable);

    // Persistence
    Q_INVOKABLE void load();
    Q_INVOKABLE void save();
    Q_INVOKABLE void reset();

Q_SIGNALS:
    void settingsChanged();
    void toggleOverlayShortcutChanged();
    void placementMarginXChanged();
    void placementMarginYChanged();
    void positionOnStartupChanged();

private:
    static int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                const char* settingName);

    QString m_toggleOverlayShortcut;
    int m_placementMarginX = Defaults::PlacementMarginX;
    int m_placementMarginY = Defaults::PlacementMarginY;
    bool m_positionOnStartup = true;
};

} // namespace TopNote
