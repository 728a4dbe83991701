// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>
#include <QCoreApplication>

#include "core/constants.h"
#include "shell/services/DBusGeometryOwner.h"

using namespace Elixi;

/**
 * @brief Unit tests for DBusGeometryOwner failure reporting
 *
 * The window host is never running here. With a session bus the call fails
 * with ServiceUnknown; without one it fails before sending. Either way the
 * query answers exactly once with no bounds and reports an error.
 */
class TestDBusGeometryOwner : public QObject
{
    Q_OBJECT

private:
    static QString missingService()
    {
        return QStringLiteral("org.elixi.test.Missing%1").arg(QCoreApplication::applicationPid());
    }

private Q_SLOTS:
    void testQueryWithoutHostFails()
    {
        DBusGeometryOwner owner(missingService(), QStringLiteral("/WindowHost"), QStringLiteral("org.elixi.WindowHost"),
                                Defaults::QueryTimeoutMs);
        QSignalSpy errorSpy(&owner, &IGeometryOwner::errorOccurred);

        int calls = 0;
        std::optional<QRect> result = QRect(1, 1, 1, 1);
        owner.queryBounds([&](const std::optional<WindowBounds>& bounds) {
            ++calls;
            result = bounds;
        });

        QTRY_COMPARE_WITH_TIMEOUT(calls, 1, 5000);
        QVERIFY(!result.has_value());
        QCOMPARE(errorSpy.count(), 1);
        QVERIFY(!errorSpy.first().first().toString().isEmpty());

        // No second answer for the same query
        QTest::qWait(50);
        QCOMPARE(calls, 1);
    }

    void testDisplayQueryWithoutHostFails()
    {
        DBusGeometryOwner owner(missingService(), QStringLiteral("/WindowHost"), QStringLiteral("org.elixi.WindowHost"),
                                Defaults::QueryTimeoutMs);

        bool answered = false;
        bool hadValue = true;
        owner.queryDisplayBounds([&](const std::optional<WindowBounds>& area) {
            answered = true;
            hadValue = area.has_value();
        });

        QTRY_VERIFY_WITH_TIMEOUT(answered, 5000);
        QVERIFY(!hadValue);
    }
};

QTEST_MAIN(TestDBusGeometryOwner)
#include "test_dbus_geometry_owner.moc"
