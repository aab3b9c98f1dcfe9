// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <KConfigGroup>
#include <KSharedConfig>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

#include "config/configdefaults.h"
#include "config/settings.h"

using namespace TabDrop;

/**
 * @brief Unit tests for Settings
 *
 * Each test works on its own tabdroprc inside a temporary directory.
 *
 * Tests cover:
 * - Defaults taken from tabdrop.kcfg
 * - Out-of-range values on disk replaced with defaults
 * - Setter clamping and change signals
 * - Save/load and reset
 */
class TestSettings : public QObject
{
    Q_OBJECT

private:
    KSharedConfig::Ptr openConfig(const QTemporaryDir& dir) const
    {
        return KSharedConfig::openConfig(dir.filePath(QStringLiteral("tabdroprc")), KConfig::SimpleConfig);
    }

private Q_SLOTS:
    void test_defaults_fromKcfg()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        Settings settings(openConfig(dir));

        QCOMPARE(settings.dragThreshold(), ConfigDefaults::dragThreshold());
        QCOMPARE(settings.dragThreshold(), 4);
        QCOMPARE(settings.windowEdgeHysteresis(), 2);
        QCOMPARE(settings.cellSize(), 36.0);
        QCOMPARE(settings.cellSpacing(), 2.0);
        QCOMPARE(settings.indicatorThickness(), 3.0);
        QCOMPARE(settings.indicatorInset(), 10.0);
        QCOMPARE(settings.emptyZoneIndicatorFraction(), ConfigDefaults::emptyZoneIndicatorFraction());
        QCOMPARE(settings.previewWidth(), 320);
        QCOMPARE(settings.previewHeight(), 160);
        QVERIFY(settings.centerPreviewInSidebar());
        QVERIFY(settings.previewWindowEnabled());
        QVERIFY(settings.feedbackEnabled());
    }

    void test_load_invalidValuesReplaced()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        {
            KSharedConfig::Ptr config = openConfig(dir);
            KConfigGroup drag = config->group(QStringLiteral("Drag"));
            drag.writeEntry(QStringLiteral("Threshold"), 999);
            drag.writeEntry(QStringLiteral("WindowEdgeHysteresis"), 7);
            KConfigGroup geometry = config->group(QStringLiteral("Geometry"));
            geometry.writeEntry(QStringLiteral("CellSize"), -5.0);
            geometry.writeEntry(QStringLiteral("EmptyZoneIndicatorFraction"), 1.5);
            KConfigGroup preview = config->group(QStringLiteral("Preview"));
            preview.writeEntry(QStringLiteral("Width"), 4);
            QVERIFY(config->sync());
        }

        Settings settings(openConfig(dir));
        QCOMPARE(settings.dragThreshold(), ConfigDefaults::dragThreshold());
        QCOMPARE(settings.windowEdgeHysteresis(), 7);
        QCOMPARE(settings.cellSize(), ConfigDefaults::cellSize());
        QCOMPARE(settings.emptyZoneIndicatorFraction(), ConfigDefaults::emptyZoneIndicatorFraction());
        QCOMPARE(settings.previewWidth(), ConfigDefaults::previewWidth());
    }

    void test_setter_clampsAndSignals()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        Settings settings(openConfig(dir));
        QSignalSpy thresholdSpy(&settings, &Settings::dragThresholdChanged);
        QSignalSpy changedSpy(&settings, &Settings::settingsChanged);

        settings.setDragThreshold(500);
        QCOMPARE(settings.dragThreshold(), ConfigDefaults::dragThresholdMax());
        QCOMPARE(thresholdSpy.count(), 1);
        QCOMPARE(changedSpy.count(), 1);

        // Clamps to the same value: no change
        settings.setDragThreshold(900);
        QCOMPARE(thresholdSpy.count(), 1);

        settings.setCellSpacing(-3.0);
        QCOMPARE(settings.cellSpacing(), ConfigDefaults::cellSpacingMin());
        settings.setPreviewHeight(1);
        QCOMPARE(settings.previewHeight(), ConfigDefaults::previewSizeMin());
    }

    void test_saveLoad_roundTrip()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        {
            Settings settings(openConfig(dir));
            settings.setDragThreshold(12);
            settings.setCellSize(44.0);
            settings.setIndicatorInset(4.0);
            settings.setPreviewWidth(240);
            settings.setCenterPreviewInSidebar(false);
            settings.setPreviewWindowEnabled(false);
            settings.setFeedbackEnabled(false);
            settings.save();
        }

        Settings reloaded(openConfig(dir));
        QCOMPARE(reloaded.dragThreshold(), 12);
        QCOMPARE(reloaded.cellSize(), 44.0);
        QCOMPARE(reloaded.indicatorInset(), 4.0);
        QCOMPARE(reloaded.previewWidth(), 240);
        QVERIFY(!reloaded.centerPreviewInSidebar());
        QVERIFY(!reloaded.previewWindowEnabled());
        QVERIFY(!reloaded.feedbackEnabled());
    }

    void test_load_emitsSettingsChanged()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        Settings settings(openConfig(dir));
        QSignalSpy changedSpy(&settings, &Settings::settingsChanged);
        settings.load();
        QCOMPARE(changedSpy.count(), 1);
    }

    void test_reset_restoresDefaults()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        Settings settings(openConfig(dir));
        settings.setDragThreshold(30);
        settings.setFeedbackEnabled(false);
        settings.save();

        settings.reset();
        QCOMPARE(settings.dragThreshold(), ConfigDefaults::dragThreshold());
        QVERIFY(settings.feedbackEnabled());
        QVERIFY(!openConfig(dir)->hasGroup(QStringLiteral("Drag")));
    }
};

QTEST_MAIN(TestSettings)
#include "test_settings.moc"
