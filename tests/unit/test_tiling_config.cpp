// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QJsonObject>
#include <QTemporaryDir>

#include <KConfigGroup>
#include <KSharedConfig>

#include "tiling/TilingConfig.h"
#include "core/constants.h"

using namespace Tessera;

/**
 * @brief Unit tests for TilingConfig
 *
 * Tests cover:
 * - Defaults matching TilingDefaults
 * - JSON round trip, missing keys and clamping
 * - KConfig load/save, including invalid stored values
 */
class TestTilingConfig : public QObject
{
    Q_OBJECT

private:
    KSharedConfigPtr openTempConfig(const QTemporaryDir &dir) const
    {
        return KSharedConfig::openConfig(dir.filePath(QStringLiteral("tesserarc")), KConfig::SimpleConfig);
    }

private Q_SLOTS:
    void testDefaults()
    {
        const TilingConfig config;
        QCOMPARE(config.outerGap, TilingDefaults::OuterGap);
        QCOMPARE(config.innerGap, TilingDefaults::InnerGap);
        QCOMPARE(config.unmapPolicy, TilingConfig::UnmapPolicy::MergeIntoFirst);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // JSON
    // ═══════════════════════════════════════════════════════════════════════════

    void testJson_roundTrip()
    {
        TilingConfig config;
        config.outerGap = 12;
        config.innerGap = 7;
        config.unmapPolicy = TilingConfig::UnmapPolicy::MergeIntoLargest;

        const TilingConfig restored = TilingConfig::fromJson(config.toJson());
        QCOMPARE(restored, config);
    }

    void testJson_missingKeysKeepDefaults()
    {
        QJsonObject json;
        json[TilingJsonKeys::InnerGap] = 10;

        const TilingConfig config = TilingConfig::fromJson(json);
        QCOMPARE(config.innerGap, 10);
        QCOMPARE(config.outerGap, TilingDefaults::OuterGap);
        QCOMPARE(config.unmapPolicy, TilingConfig::UnmapPolicy::MergeIntoFirst);
    }

    void testJson_clampsGaps()
    {
        QJsonObject json;
        json[TilingJsonKeys::OuterGap] = -5;
        json[TilingJsonKeys::InnerGap] = 500;

        const TilingConfig config = TilingConfig::fromJson(json);
        QCOMPARE(config.outerGap, TilingDefaults::MinGap);
        QCOMPARE(config.innerGap, TilingDefaults::MaxGap);
    }

    void testJson_unknownPolicyFallsBack()
    {
        QJsonObject json;
        json[TilingJsonKeys::UnmapPolicy] = QStringLiteral("random");

        const TilingConfig config = TilingConfig::fromJson(json);
        QCOMPARE(config.unmapPolicy, TilingConfig::UnmapPolicy::MergeIntoFirst);
    }

    void testEquality()
    {
        TilingConfig a;
        TilingConfig b;
        QVERIFY(a == b);
        b.innerGap = 9;
        QVERIFY(a != b);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // KConfig
    // ═══════════════════════════════════════════════════════════════════════════

    void testKConfig_saveAndLoad()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        TilingConfig config;
        config.outerGap = 3;
        config.innerGap = 0;
        config.unmapPolicy = TilingConfig::UnmapPolicy::MergeIntoLargest;
        config.save(openTempConfig(dir));

        // Fresh object reads back from disk
        auto reopened = openTempConfig(dir);
        reopened->reparseConfiguration();
        QCOMPARE(TilingConfig::load(reopened), config);
    }

    void testKConfig_emptyFileGivesDefaults()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QCOMPARE(TilingConfig::load(openTempConfig(dir)), TilingConfig());
    }

    void testKConfig_invalidGapUsesDefault()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        auto config = openTempConfig(dir);
        KConfigGroup group = config->group(QStringLiteral("Tiling"));
        group.writeEntry(QStringLiteral("InnerGap"), 99);
        group.writeEntry(QStringLiteral("OuterGap"), 6);

        const TilingConfig loaded = TilingConfig::load(config);
        QCOMPARE(loaded.innerGap, TilingDefaults::InnerGap);
        QCOMPARE(loaded.outerGap, 6);
    }

    void testKConfig_nullConfig()
    {
        QCOMPARE(TilingConfig::load(KSharedConfigPtr()), TilingConfig());
    }
};

QTEST_MAIN(TestTilingConfig)
#include "test_tiling_config.moc"
