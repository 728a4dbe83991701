// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QRect>
#include <QSize>

#include "core/resizecontroller.h"

using namespace Elixi;

/**
 * @brief Unit tests for ResizeController::targetSize()
 *
 * Tests cover:
 * - Growing/shrinking past the bounds clamps to them
 * - A delta landing exactly on a bound yields that bound
 * - Edge handles only touch their own axis
 * - Zero delta reproduces the baseline size
 * - Left/top handles use the same sign as right/bottom
 */
class TestResizeController : public QObject
{
    Q_OBJECT

private:
    static QRect baseline() { return QRect(100, 100, 400, 300); }

    static QSize resizeBy(ResizeDirection direction, const QPoint& delta,
                          const SizeConstraints& constraints = SizeConstraints())
    {
        const QPoint origin(500, 400);
        const ResizeState state{origin, baseline(), direction};
        return ResizeController::targetSize(state, origin + delta, constraints);
    }

    static QList<ResizeDirection> allDirections()
    {
        return {ResizeDirection::Top,      ResizeDirection::Bottom,    ResizeDirection::Left,
                ResizeDirection::Right,    ResizeDirection::TopLeft,   ResizeDirection::TopRight,
                ResizeDirection::BottomLeft, ResizeDirection::BottomRight};
    }

private Q_SLOTS:
    void testBottomRightGrowsToMaximum()
    {
        QCOMPARE(resizeBy(ResizeDirection::BottomRight, QPoint(1000, 1000)), QSize(1200, 900));
    }

    void testRightShrinksToMinimum()
    {
        QCOMPARE(resizeBy(ResizeDirection::Right, QPoint(-500, 0)), QSize(300, 300));
    }

    void testExactBounds()
    {
        // 400 + 800 = 1200, 300 + 600 = 900
        QCOMPARE(resizeBy(ResizeDirection::BottomRight, QPoint(800, 600)), QSize(1200, 900));
        // 400 - 100 = 300, 300 - 50 = 250
        QCOMPARE(resizeBy(ResizeDirection::BottomRight, QPoint(-100, -50)), QSize(300, 250));
        // One past the bounds
        QCOMPARE(resizeBy(ResizeDirection::BottomRight, QPoint(801, 601)), QSize(1200, 900));
        QCOMPARE(resizeBy(ResizeDirection::BottomRight, QPoint(-101, -51)), QSize(300, 250));
    }

    void testWithinBounds_data()
    {
        QTest::addColumn<int>("direction");
        QTest::addColumn<QPoint>("delta");
        QTest::addColumn<QSize>("expected");

        QTest::newRow("right") << static_cast<int>(ResizeDirection::Right) << QPoint(50, 70) << QSize(450, 300);
        QTest::newRow("bottom") << static_cast<int>(ResizeDirection::Bottom) << QPoint(50, 70) << QSize(400, 370);
        QTest::newRow("left") << static_cast<int>(ResizeDirection::Left) << QPoint(50, 70) << QSize(450, 300);
        QTest::newRow("top") << static_cast<int>(ResizeDirection::Top) << QPoint(50, 70) << QSize(400, 370);
        QTest::newRow("top-left") << static_cast<int>(ResizeDirection::TopLeft) << QPoint(-50, -20)
                                  << QSize(350, 280);
        QTest::newRow("top-right") << static_cast<int>(ResizeDirection::TopRight) << QPoint(50, 20)
                                   << QSize(450, 320);
        QTest::newRow("bottom-left") << static_cast<int>(ResizeDirection::BottomLeft) << QPoint(-50, 20)
                                     << QSize(350, 320);
        QTest::newRow("bottom-right") << static_cast<int>(ResizeDirection::BottomRight) << QPoint(50, -20)
                                      << QSize(450, 280);
    }

    void testWithinBounds()
    {
        QFETCH(int, direction);
        QFETCH(QPoint, delta);
        QFETCH(QSize, expected);

        QCOMPARE(resizeBy(static_cast<ResizeDirection>(direction), delta), expected);
    }

    void testAxisIsolation()
    {
        const QPoint delta(123, -77);

        QCOMPARE(resizeBy(ResizeDirection::Left, delta).height(), baseline().height());
        QCOMPARE(resizeBy(ResizeDirection::Right, delta).height(), baseline().height());
        QCOMPARE(resizeBy(ResizeDirection::Top, delta).width(), baseline().width());
        QCOMPARE(resizeBy(ResizeDirection::Bottom, delta).width(), baseline().width());
    }

    void testZeroDeltaIsNoOp()
    {
        for (ResizeDirection direction : allDirections()) {
            QCOMPARE(resizeBy(direction, QPoint(0, 0)), baseline().size());
        }
    }

    void testAlwaysWithinConstraints()
    {
        const SizeConstraints constraints;
        const QList<QPoint> deltas{QPoint(-10000, -10000), QPoint(10000, 10000), QPoint(-10000, 10000),
                                   QPoint(10000, -10000), QPoint(-101, 601),    QPoint(1, -1)};

        for (ResizeDirection direction : allDirections()) {
            for (const QPoint& delta : deltas) {
                const QSize size = resizeBy(direction, delta, constraints);
                QVERIFY(size.width() >= constraints.minimum.width());
                QVERIFY(size.width() <= constraints.maximum.width());
                QVERIFY(size.height() >= constraints.minimum.height());
                QVERIFY(size.height() <= constraints.maximum.height());
            }
        }
    }

    void testUntouchedAxisClampedWhenBaselineOutOfRange()
    {
        // Host reported a window taller than the maximum
        const QPoint origin(0, 0);
        const ResizeState state{origin, QRect(0, 0, 400, 1000), ResizeDirection::Right};
        QCOMPARE(ResizeController::targetSize(state, QPoint(10, 0), SizeConstraints()), QSize(410, 900));
    }

    void testCustomConstraints()
    {
        const SizeConstraints constraints{QSize(200, 200), QSize(500, 500)};
        QCOMPARE(resizeBy(ResizeDirection::BottomRight, QPoint(-300, -300), constraints), QSize(200, 200));
        QCOMPARE(resizeBy(ResizeDirection::BottomRight, QPoint(300, 300), constraints), QSize(500, 500));
    }
};

QTEST_MAIN(TestResizeController)
#include "test_resize_controller.moc"
