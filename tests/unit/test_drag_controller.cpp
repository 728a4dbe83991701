// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QRect>

#include "core/dragcontroller.h"

using namespace Elixi;

/**
 * @brief Unit tests for DragController::targetPosition()
 *
 * The dispatched position is always baseline + (pointer - origin), exactly,
 * with no clamping to any screen.
 */
class TestDragController : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testTranslation_data()
    {
        QTest::addColumn<QPoint>("pointer");
        QTest::addColumn<QPoint>("expected");

        // Baseline {100, 100, 400, 300}, pressed at (150, 110)
        QTest::newRow("no movement") << QPoint(150, 110) << QPoint(100, 100);
        QTest::newRow("right and down") << QPoint(200, 160) << QPoint(150, 150);
        QTest::newRow("left and up") << QPoint(100, 60) << QPoint(50, 50);
        QTest::newRow("off screen") << QPoint(-500, -800) << QPoint(-550, -810);
        QTest::newRow("far") << QPoint(5150, 3110) << QPoint(5100, 3100);
    }

    void testTranslation()
    {
        QFETCH(QPoint, pointer);
        QFETCH(QPoint, expected);

        const DragState drag{QPoint(150, 110), QRect(100, 100, 400, 300)};
        QCOMPARE(DragController::targetPosition(drag, pointer), expected);
    }

    void testRelativeToBaselineNotPreviousMove()
    {
        const DragState drag{QPoint(10, 10), QRect(0, 0, 400, 300)};

        // Each result depends only on the session, not on earlier moves
        QCOMPARE(DragController::targetPosition(drag, QPoint(20, 20)), QPoint(10, 10));
        QCOMPARE(DragController::targetPosition(drag, QPoint(30, 30)), QPoint(20, 20));
        QCOMPARE(DragController::targetPosition(drag, QPoint(20, 20)), QPoint(10, 10));
    }
};

QTEST_MAIN(TestDragController)
#include "test_drag_controller.moc"
