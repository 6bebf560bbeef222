// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QFile>
#include <QSignalSpy>
#include <QStandardPaths>
#include <KConfigGroup>
#include <KSharedConfig>

#include "config/configdefaults.h"
#include "config/settings.h"
#include "core/constants.h"

using namespace TopNote;

/**
 * @brief Unit tests for Settings persistence and validation
 *
 * Tests cover:
 * - Defaults from topnote.kcfg when no config exists
 * - Runtime setters clamp margins and emit change signals once
 * - save() / load() round trip through topnoterc
 * - Out-of-range values on disk fall back to defaults
 * - reset() restores defaults
 */
class TestSettings : public QObject
{
    Q_OBJECT

private:
    static QString configPath()
    {
        return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation) + QStringLiteral("/topnoterc");
    }

private Q_SLOTS:

    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
    }

    void init()
    {
        QFile::remove(configPath());
        KSharedConfig::openConfig(QStringLiteral("topnoterc"))->reparseConfiguration();
    }

    void cleanupTestCase()
    {
        QFile::remove(configPath());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Defaults
    // ═══════════════════════════════════════════════════════════════════════════

    void test_defaults()
    {
        Settings settings;
        QCOMPARE(settings.toggleOverlayShortcut(), QStringLiteral("Meta+Shift+`"));
        QCOMPARE(settings.placementMarginX(), 20);
        QCOMPARE(settings.placementMarginY(), 40);
        QVERIFY(settings.positionOnStartup());

        QCOMPARE(ConfigDefaults::marginX(), Defaults::PlacementMarginX);
        QCOMPARE(ConfigDefaults::marginY(), Defaults::PlacementMarginY);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Setters
    // ═══════════════════════════════════════════════════════════════════════════

    void test_marginSetters_clamp()
    {
        Settings settings;

        settings.setPlacementMarginX(-5);
        QCOMPARE(settings.placementMarginX(), 0);

        settings.setPlacementMarginY(Defaults::MaxPlacementMargin + 1);
        QCOMPARE(settings.placementMarginY(), Defaults::MaxPlacementMargin);
    }

    void test_setter_emitsOnlyOnChange()
    {
        Settings settings;
        QSignalSpy specificSpy(&settings, &Settings::toggleOverlayShortcutChanged);
        QSignalSpy generalSpy(&settings, &Settings::settingsChanged);

        settings.setToggleOverlayShortcut(QStringLiteral("Meta+N"));
        settings.setToggleOverlayShortcut(QStringLiteral("Meta+N"));

        QCOMPARE(specificSpy.count(), 1);
        QCOMPARE(generalSpy.count(), 1);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Persistence
    // ═══════════════════════════════════════════════════════════════════════════

    void test_saveLoad_roundTrip()
    {
        {
            Settings settings;
            settings.setToggleOverlayShortcut(QStringLiteral("Ctrl+Alt+N"));
            settings.setPlacementMarginX(64);
            settings.setPlacementMarginY(8);
            settings.setPositionOnStartup(false);
            settings.save();
        }

        Settings reloaded;
        QCOMPARE(reloaded.toggleOverlayShortcut(), QStringLiteral("Ctrl+Alt+N"));
        QCOMPARE(reloaded.placementMarginX(), 64);
        QCOMPARE(reloaded.placementMarginY(), 8);
        QVERIFY(!reloaded.positionOnStartup());
    }

    void test_outOfRangeOnDisk_fallsBackToDefault()
    {
        auto config = KSharedConfig::openConfig(QStringLiteral("topnoterc"));
        KConfigGroup placement = config->group(QStringLiteral("Placement"));
        placement.writeEntry(QStringLiteral("MarginX"), -100);
        placement.writeEntry(QStringLiteral("MarginY"), 999999);
        QVERIFY(config->sync());

        Settings settings;
        QCOMPARE(settings.placementMarginX(), ConfigDefaults::marginX());
        QCOMPARE(settings.placementMarginY(), ConfigDefaults::marginY());
    }

    void test_reset_restoresDefaults()
    {
        Settings settings;
        settings.setPlacementMarginX(300);
        settings.setToggleOverlayShortcut(QStringLiteral("Meta+N"));
        settings.save();

        QSignalSpy marginSpy(&settings, &Settings::placementMarginXChanged);
        settings.reset();

        QCOMPARE(settings.placementMarginX(), ConfigDefaults::marginX());
        QCOMPARE(settings.toggleOverlayShortcut(), ConfigDefaults::toggleOverlayShortcut());
        QCOMPARE(marginSpy.count(), 1);

        Settings reloaded;
        QCOMPARE(reloaded.placementMarginX(), ConfigDefaults::marginX());
    }
};

QTEST_MAIN(TestSettings)
#include "test_settings.moc"
