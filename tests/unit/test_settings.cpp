// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QFile>
#include <QTemporaryDir>

#include <KConfigGroup>
#include <KSharedConfig>

#include "config/settings.h"
#include "core/constants.h"

using namespace Elixi;

/**
 * @brief Unit tests for Settings loading and validation
 *
 * Tests cover:
 * - Defaults when the file is empty (must match the built-in constants)
 * - Valid values are read
 * - Out-of-range values fall back per key
 * - A contradictory min/max pair resets all size constraints
 * - Empty D-Bus names fall back to the defaults
 * - load() picks up changes written after construction
 */
class TestSettings : public QObject
{
    Q_OBJECT

private:
    KSharedConfig::Ptr openConfig()
    {
        return KSharedConfig::openConfig(m_dir.filePath(QStringLiteral("elixishellrc")), KConfig::SimpleConfig);
    }

    void writeEntries(const QString& group, const QList<QPair<QString, QVariant>>& entries)
    {
        KSharedConfig::Ptr config = openConfig();
        KConfigGroup configGroup = config->group(group);
        for (const auto& entry : entries) {
            configGroup.writeEntry(entry.first, entry.second);
        }
        config->sync();
    }

private Q_SLOTS:
    void init()
    {
        QVERIFY(m_dir.isValid());
        QFile::remove(m_dir.filePath(QStringLiteral("elixishellrc")));
        openConfig()->reparseConfiguration();
    }

    void testDefaults()
    {
        const Settings settings(openConfig());

        QVERIFY(settings.sizeConstraints() == SizeConstraints());
        QCOMPARE(settings.sizeConstraints().minimum, QSize(Defaults::MinWidth, Defaults::MinHeight));
        QCOMPARE(settings.sizeConstraints().maximum, QSize(Defaults::MaxWidth, Defaults::MaxHeight));
        QVERIFY(settings.alwaysOnTop());
        QVERIFY(settings.placementEnabled());
        QCOMPARE(settings.placementInset(), QSize(Defaults::PlacementInsetX, Defaults::PlacementInsetY));
        QCOMPARE(settings.serviceName(), QStringLiteral("org.elixi.WindowHost"));
        QCOMPARE(settings.objectPath(), QStringLiteral("/WindowHost"));
        QCOMPARE(settings.interfaceName(), QStringLiteral("org.elixi.WindowHost"));
        QCOMPARE(settings.queryTimeoutMs(), Defaults::QueryTimeoutMs);
    }

    void testReadsValidValues()
    {
        writeEntries(QStringLiteral("Window"), {{QStringLiteral("MinWidth"), 200},
                                                {QStringLiteral("MinHeight"), 150},
                                                {QStringLiteral("MaxWidth"), 1600},
                                                {QStringLiteral("MaxHeight"), 1000},
                                                {QStringLiteral("AlwaysOnTop"), false}});
        writeEntries(QStringLiteral("Placement"), {{QStringLiteral("Enabled"), false},
                                                   {QStringLiteral("InsetX"), 500},
                                                   {QStringLiteral("InsetY"), 450}});
        writeEntries(QStringLiteral("GeometryOwner"), {{QStringLiteral("ServiceName"), QStringLiteral("org.test.Host")},
                                                       {QStringLiteral("ObjectPath"), QStringLiteral("/Test")},
                                                       {QStringLiteral("Interface"), QStringLiteral("org.test.Iface")},
                                                       {QStringLiteral("QueryTimeoutMs"), 500}});

        const Settings settings(openConfig());

        QCOMPARE(settings.sizeConstraints().minimum, QSize(200, 150));
        QCOMPARE(settings.sizeConstraints().maximum, QSize(1600, 1000));
        QVERIFY(!settings.alwaysOnTop());
        QVERIFY(!settings.placementEnabled());
        QCOMPARE(settings.placementInset(), QSize(500, 450));
        QCOMPARE(settings.serviceName(), QStringLiteral("org.test.Host"));
        QCOMPARE(settings.objectPath(), QStringLiteral("/Test"));
        QCOMPARE(settings.interfaceName(), QStringLiteral("org.test.Iface"));
        QCOMPARE(settings.queryTimeoutMs(), 500);
    }

    void testOutOfRangeFallsBackPerKey()
    {
        writeEntries(QStringLiteral("Window"), {{QStringLiteral("MinWidth"), 10}, {QStringLiteral("MaxHeight"), 800}});
        writeEntries(QStringLiteral("Placement"), {{QStringLiteral("InsetX"), -5}});
        writeEntries(QStringLiteral("GeometryOwner"), {{QStringLiteral("QueryTimeoutMs"), 50}});

        const Settings settings(openConfig());

        QCOMPARE(settings.sizeConstraints().minimum, QSize(Defaults::MinWidth, Defaults::MinHeight));
        QCOMPARE(settings.sizeConstraints().maximum, QSize(Defaults::MaxWidth, 800));
        QCOMPARE(settings.placementInset(), QSize(Defaults::PlacementInsetX, Defaults::PlacementInsetY));
        QCOMPARE(settings.queryTimeoutMs(), Defaults::QueryTimeoutMs);
    }

    void testContradictoryConstraintsReset()
    {
        writeEntries(QStringLiteral("Window"), {{QStringLiteral("MinWidth"), 900},
                                                {QStringLiteral("MinHeight"), 400},
                                                {QStringLiteral("MaxWidth"), 800},
                                                {QStringLiteral("MaxHeight"), 600}});

        const Settings settings(openConfig());

        QVERIFY(settings.sizeConstraints().isValid());
        QVERIFY(settings.sizeConstraints() == SizeConstraints());
    }

    void testEmptyNamesFallBack()
    {
        writeEntries(QStringLiteral("GeometryOwner"), {{QStringLiteral("ServiceName"), QStringLiteral("  ")},
                                                       {QStringLiteral("ObjectPath"), QString()}});

        const Settings settings(openConfig());

        QCOMPARE(settings.serviceName(), QStringLiteral("org.elixi.WindowHost"));
        QCOMPARE(settings.objectPath(), QStringLiteral("/WindowHost"));
    }

    void testReload()
    {
        Settings settings(openConfig());
        QCOMPARE(settings.queryTimeoutMs(), Defaults::QueryTimeoutMs);

        writeEntries(QStringLiteral("GeometryOwner"), {{QStringLiteral("QueryTimeoutMs"), 750}});
        settings.load();
        QCOMPARE(settings.queryTimeoutMs(), 750);
    }

    void testCommandLineOverrides()
    {
        Settings settings(openConfig());
        settings.setServiceName(QStringLiteral("org.other.Host"));
        settings.setPlacementEnabled(false);

        QCOMPARE(settings.serviceName(), QStringLiteral("org.other.Host"));
        QVERIFY(!settings.placementEnabled());
    }

private:
    QTemporaryDir m_dir;
};

QTEST_MAIN(TestSettings)
#include "test_settings.moc"
