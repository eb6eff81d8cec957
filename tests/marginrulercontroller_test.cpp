#include <QTest>
#include <QObject>
#include <QSignalSpy>
#include <cmath>
#include "marginrulercontroller.h"

using Handle = MarginRulerController::Handle;
using PageGeometry::Margins;

class MarginRulerControllerTests : public QObject {
    Q_OBJECT

private:
    static bool near(double a, double b) {
        return std::abs(a - b) < 1e-3;
    }

    static const double kTenPxInMm;

private slots:
    void rtlLeftHandleMovesRightMargin() {
        const Margins start;
        const Margins result = MarginRulerController::applyDrag(Handle::Left, start, QPointF(10, 0), 1.0, true);
        QVERIFY2(near(result.right, 20.0 + 2.6458), qPrintable(QString::number(result.right)));
        QCOMPARE(result.left, start.left);
        QCOMPARE(result.top, start.top);
    }

    void handleMappingPerDirection() {
        const Margins start;
        const QPointF delta(10, 10);

        QVERIFY(near(MarginRulerController::applyDrag(Handle::Right, start, delta, 1.0, true).left, 20.0 - kTenPxInMm));
        QVERIFY(near(MarginRulerController::applyDrag(Handle::Left, start, delta, 1.0, false).left, 20.0 + kTenPxInMm));
        QVERIFY(near(MarginRulerController::applyDrag(Handle::Right, start, delta, 1.0, false).right, 20.0 - kTenPxInMm));
        QVERIFY(near(MarginRulerController::applyDrag(Handle::Top, start, delta, 1.0, true).top, 20.0 + kTenPxInMm));
        QVERIFY(near(MarginRulerController::applyDrag(Handle::Bottom, start, delta, 1.0, true).bottom, 20.0 - kTenPxInMm));
        QVERIFY(MarginRulerController::applyDrag(Handle::None, start, delta, 1.0, true) == start);
    }

    void dragIsClampedToMarginRange() {
        const Margins start;
        QCOMPARE(MarginRulerController::applyDrag(Handle::Left, start, QPointF(1000, 0), 1.0, true).right, 50.0);
        QCOMPARE(MarginRulerController::applyDrag(Handle::Right, start, QPointF(1000, 0), 1.0, true).left, 0.0);
    }

    void zoomScalesDragDistance() {
        const Margins start;
        const Margins result = MarginRulerController::applyDrag(Handle::Top, start, QPointF(0, 10), 2.0, true);
        QVERIFY(near(result.top, 20.0 + kTenPxInMm / 2.0));
    }

    void moveWithoutDragIsIgnored() {
        MarginRulerController controller;
        QSignalSpy changed(&controller, &MarginRulerController::marginsChanged);
        controller.pointerMove(QPointF(50, 0));
        controller.pointerUp(QPointF(50, 0));
        QTest::qWait(MarginRulerController::FRAME_INTERVAL_MS * 3);
        QCOMPARE(changed.count(), 0);
        QVERIFY(!controller.pointerDown(Handle::None, QPointF()));
    }

    void movesAreCoalescedPerFrame() {
        MarginRulerController controller;
        QSignalSpy changed(&controller, &MarginRulerController::marginsChanged);
        QSignalSpy finished(&controller, &MarginRulerController::dragFinished);

        QVERIFY(controller.pointerDown(Handle::Left, QPointF(100, 0)));
        QVERIFY(controller.isDragging());
        controller.pointerMove(QPointF(105, 0));
        controller.pointerMove(QPointF(110, 0));
        QTRY_COMPARE(changed.count(), 1);
        QVERIFY(near(controller.margins().right, 20.0 + kTenPxInMm));

        controller.pointerUp(QPointF(110, 0));
        QCOMPARE(changed.count(), 1);
        QCOMPARE(finished.count(), 1);
        QVERIFY(!controller.isDragging());
        QCOMPARE(controller.activeHandle(), Handle::None);
    }

    void cancelAbandonsPendingMove() {
        MarginRulerController controller;
        QSignalSpy changed(&controller, &MarginRulerController::marginsChanged);
        QSignalSpy finished(&controller, &MarginRulerController::dragFinished);

        controller.pointerDown(Handle::Top, QPointF(0, 0));
        controller.pointerMove(QPointF(0, 40));
        controller.pointerCancel();
        QTest::qWait(MarginRulerController::FRAME_INTERVAL_MS * 3);

        QCOMPARE(changed.count(), 0);
        QCOMPARE(finished.count(), 1);
        QCOMPARE(controller.margins().top, PageGeometry::DEFAULT_MARGIN_MM);
    }

    void ltrControllerUsesLtrMapping() {
        MarginRulerController controller;
        controller.setRtl(false);
        controller.pointerDown(Handle::Right, QPointF(500, 0));
        controller.pointerUp(QPointF(490, 0));
        QVERIFY(near(controller.margins().right, 20.0 + kTenPxInMm));
        QCOMPARE(controller.margins().left, 20.0);
    }
};

const double MarginRulerControllerTests::kTenPxInMm = 10.0 / PageGeometry::MM_TO_PX;

QTEST_MAIN(MarginRulerControllerTests)
#include "marginrulercontroller_test.moc"
