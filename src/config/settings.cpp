// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"
#include <KConfigGroup>
#include <KSharedConfig>

namespace TopNote {

// ═══════════════════════════════════════════════════════════════════════════════
// Macros for setter patterns
// ═══════════════════════════════════════════════════════════════════════════════

// Simple setter: if changed, update member, emit specific signal, emit settingsChanged
#define SETTINGS_SETTER(Type, name, member, signal) \
    void Settings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

// Clamped int setter: clamp value, then apply if changed
#define SETTINGS_SETTER_CLAMPED(name, member, signal, minVal, maxVal) \
    void Settings::set##name(int value) \
    { \
        value = qBound(minVal, value, maxVal); \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

namespace {
constexpr const char* ShortcutsGroup = "Shortcuts";
constexpr const char* PlacementGroup = "Placement";
} // anonymous namespace

Settings::Settings(QObject* parent)
    : QObject(parent)
{
    load();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════════

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Setters
// ═══════════════════════════════════════════════════════════════════════════════

SETTINGS_SETTER(const QString&, ToggleOverlayShortcut, m_toggleOverlayShortcut, toggleOverlayShortcutChanged)
SETTINGS_SETTER_CLAMPED(PlacementMarginX, m_placementMarginX, placementMarginXChanged, 0, Defaults::MaxPlacementMargin)
SETTINGS_SETTER_CLAMPED(PlacementMarginY, m_placementMarginY, placementMarginYChanged, 0, Defaults::MaxPlacementMargin)
SETTINGS_SETTER(bool, PositionOnStartup, m_positionOnStartup, positionOnStartupChanged)

// ═══════════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::load()
{
    auto config = KSharedConfig::openConfig(QStringLiteral("topnoterc"));

    // KSharedConfig caches in memory; pick up edits made by other processes
    config->reparseConfiguration();

    KConfigGroup shortcuts = config->group(QLatin1String(ShortcutsGroup));
    KConfigGroup placement = config->group(QLatin1String(PlacementGroup));

    m_toggleOverlayShortcut =
        shortcuts.readEntry(QLatin1String("ToggleOverlayShortcut"), ConfigDefaults::toggleOverlayShortcut());

    m_placementMarginX = readValidatedInt(placement, "MarginX", ConfigDefaults::marginX(), 0,
                                          Defaults::MaxPlacementMargin, "placement margin X");
    m_placementMarginY = readValidatedInt(placement, "MarginY", ConfigDefaults::marginY(), 0,
                                          Defaults::MaxPlacementMargin, "placement margin Y");
    m_positionOnStartup = placement.readEntry(QLatin1String("PositionOnStartup"), ConfigDefaults::positionOnStartup());

    qCDebug(lcConfig) << "Settings loaded: shortcut" << m_toggleOverlayShortcut << "margins" << m_placementMarginX
                      << m_placementMarginY << "position on startup" << m_positionOnStartup;

    Q_EMIT settingsChanged();
}

void Settings::save()
{
    auto config = KSharedConfig::openConfig(QStringLiteral("topnoterc"));
    KConfigGroup shortcuts = config->group(QLatin1String(ShortcutsGroup));
    KConfigGroup placement = config->group(QLatin1String(PlacementGroup));

    shortcuts.writeEntry(QLatin1String("ToggleOverlayShortcut"), m_toggleOverlayShortcut);

    placement.writeEntry(QLatin1String("MarginX"), m_placementMarginX);
    placement.writeEntry(QLatin1String("MarginY"), m_placementMarginY);
    placement.writeEntry(QLatin1String("PositionOnStartup"), m_positionOnStartup);

    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write settings to" << config->name();
    }
}

void Settings::reset()
{
    auto config = KSharedConfig::openConfig(QStringLiteral("topnoterc"));
    config->deleteGroup(QLatin1String(ShortcutsGroup));
    config->deleteGroup(QLatin1String(PlacementGroup));
    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write settings to" << config->name();
    }

    load();
    Q_EMIT toggleOverlayShortcutChanged();
    Q_EMIT placementMarginXChanged();
    Q_EMIT placementMarginYChanged();
    Q_EMIT positionOnStartupChanged();
    qCInfo(lcConfig) << "Settings reset to defaults";
}

} // namespace TopNote
