#include <QTest>
#include <QObject>
#include <cmath>
#include <limits>
#include "pagegeometry.h"

using namespace PageGeometry;

class PageGeometryTests : public QObject {
    Q_OBJECT

private:
    static bool near(double a, double b, double tolerance = 1e-6) {
        return std::abs(a - b) <= tolerance;
    }

private slots:
    void a4PortraitWithTwentyMillimeterMargins() {
        PageLayout layout;
        const PageDimensions dims = resolvePageDimensions(layout);
        const ContentDimensions content = resolveContentDimensions(dims, layout.margins, 1.0);

        QVERIFY2(near(content.height, 1122.5, 0.1), qPrintable(QString::number(content.height)));
        QVERIFY(near(content.width, 210.0 * MM_TO_PX));
        QVERIFY(near(content.availableHeight(), (297.0 - 40.0) * MM_TO_PX));
        QVERIFY(near(content.availableWidth(), (210.0 - 40.0) * MM_TO_PX));
        QVERIFY(near(content.marginTop, 20.0 * MM_TO_PX));
    }

    void letterAndLandscape() {
        const PageDimensions letter = resolvePageDimensions(PageSize::Letter, 0, 0, Orientation::Portrait);
        QCOMPARE(letter.widthMm, 216.0);
        QCOMPARE(letter.heightMm, 279.0);

        const PageDimensions landscape = resolvePageDimensions(PageSize::A4, 0, 0, Orientation::Landscape);
        QCOMPARE(landscape.widthMm, 297.0);
        QCOMPARE(landscape.heightMm, 210.0);
        QVERIFY(landscape.width > landscape.height);
    }

    void invalidCustomSizeFallsBackToA4Portrait() {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        const PageDimensions dims = resolvePageDimensions(PageSize::Custom, nan, 100.0, Orientation::Landscape);
        QVERIFY(dims.isValid());
        QCOMPARE(dims.widthMm, A4_WIDTH_MM);
        QCOMPARE(dims.heightMm, A4_HEIGHT_MM);

        const PageDimensions negative = resolvePageDimensions(PageSize::Custom, -5.0, 100.0, Orientation::Portrait);
        QCOMPARE(negative.widthMm, A4_WIDTH_MM);
    }

    void customSizeIsClamped() {
        const PageDimensions dims = resolvePageDimensions(PageSize::Custom, 20.0, 2000.0, Orientation::Portrait);
        QCOMPARE(dims.widthMm, MIN_CUSTOM_DIMENSION_MM);
        QCOMPARE(dims.heightMm, MAX_CUSTOM_DIMENSION_MM);
    }

    void zoomScalesPixelsOnly() {
        PageLayout layout;
        const PageDimensions dims = resolvePageDimensions(layout);
        const ContentDimensions one = resolveContentDimensions(dims, layout.margins, 1.0);
        const ContentDimensions two = resolveContentDimensions(dims, layout.margins, 2.0);
        QVERIFY(near(two.width, one.width * 2.0));
        QVERIFY(near(two.availableHeight(), one.availableHeight() * 2.0));
        QCOMPARE(dims.widthMm, 210.0);
    }

    void pixelMillimeterRoundTrip() {
        for (double zoom : {0.25, 1.0, 1.5, 3.0}) {
            for (double mm : {0.0, 12.5, 37.5, 210.0}) {
                QVERIFY(near(pxToMm(mmToPx(mm, zoom), zoom), mm, 1e-9));
            }
        }
        QVERIFY(near(pxToMm(10.0, 0.0), 10.0 / MM_TO_PX));
        QVERIFY(near(mmToInches(25.4), 1.0));
        QVERIFY(near(inchesToMm(2.0), 50.8));
    }

    void conversionsNeverReturnNaN() {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        const double inf = std::numeric_limits<double>::infinity();
        QVERIFY(near(mmToPx(10.0, nan), 10.0 * MM_TO_PX));
        QVERIFY(near(mmToPx(10.0, 0.0), 10.0 * MM_TO_PX));
        QVERIFY(near(mmToPx(10.0, -2.0), 10.0 * MM_TO_PX));
        QCOMPARE(mmToPx(nan, 1.0), 0.0);
        QCOMPARE(mmToPx(inf, 1.0), 0.0);
        QCOMPARE(pxToMm(nan, 1.0), 0.0);
        QVERIFY(near(pxToMm(10.0, inf), 10.0 / MM_TO_PX));
    }

    void displayFormatting() {
        QCOMPARE(formatDimension(20.0, MarginUnit::Millimeters), QString("20"));
        QCOMPARE(formatDimension(19.6, MarginUnit::Millimeters), QString("20"));
        QCOMPARE(formatDimension(mmToInches(20.0), MarginUnit::Inches), QString("0.787"));
        QVERIFY(near(fromDisplayUnit(toDisplayUnit(17.3, MarginUnit::Inches), MarginUnit::Inches), 17.3, 1e-12));
    }

    void clamps() {
        QCOMPARE(clampMargin(-5.0), 0.0);
        QCOMPARE(clampMargin(80.0), 50.0);
        QCOMPARE(clampMargin(std::numeric_limits<double>::quiet_NaN()), DEFAULT_MARGIN_MM);
        QCOMPARE(clampMargin(3.0, MarginUnit::Inches), 2.0);

        QCOMPARE(clampZoom(0.1), MIN_ZOOM);
        QCOMPARE(clampZoom(5.0), MAX_ZOOM);
        QCOMPARE(clampZoom(std::numeric_limits<double>::infinity()), DEFAULT_ZOOM);

        QCOMPARE(clampCustomDimension(std::numeric_limits<double>::quiet_NaN(), A4_WIDTH_MM), A4_WIDTH_MM);
        QCOMPARE(clampCustomDimension(5000.0, A4_WIDTH_MM), MAX_CUSTOM_DIMENSION_MM);
    }

    void sanitizeLayoutKeepsContentArea() {
        PageLayout layout;
        layout.pageSize = PageSize::Custom;
        layout.customWidth = 60.0;
        layout.customHeight = 60.0;
        layout.margins.left = 50.0;
        layout.margins.right = 50.0;
        layout.margins.top = 50.0;
        layout.margins.bottom = 50.0;

        const PageLayout sane = sanitizeLayout(layout);
        QVERIFY(near(sane.margins.left, 25.0));
        QVERIFY(near(sane.margins.right, 25.0));
        QVERIFY(sane.customWidth - sane.margins.left - sane.margins.right >= MIN_CONTENT_EXTENT_MM - 1e-9);
        QVERIFY(sane.customHeight - sane.margins.top - sane.margins.bottom >= MIN_CONTENT_EXTENT_MM - 1e-9);

        PageLayout normal;
        QVERIFY(sanitizeLayout(normal).margins == normal.margins);
    }

    void rtlPaddingSwapsHorizontalMargins() {
        Margins m;
        m.left = 10.0;
        m.right = 30.0;

        const ContentPadding rtl = contentPadding(m, true);
        QCOMPARE(rtl.left, 30.0);
        QCOMPARE(rtl.right, 10.0);
        QCOMPARE(rtl.top, m.top);

        const ContentPadding ltr = contentPadding(m, false);
        QCOMPARE(ltr.left, 10.0);
        QCOMPARE(ltr.right, 30.0);
    }

    void rulerHandleMappingIsInvertible() {
        Margins m;
        m.left = 10.0;
        m.right = 30.0;
        const double width = 210.0;

        for (bool rtl : {true, false}) {
            const HandlePositions pos = rulerHandlePositions(m, width, 297.0, rtl);
            const double fromLeft = marginFromLeftHandle(pos.left, width, rtl);
            const double fromRight = marginFromRightHandle(pos.right, width, rtl);
            if (rtl) {
                QCOMPARE(pos.left, 30.0);
                QCOMPARE(pos.right, 200.0);
                QCOMPARE(fromLeft, m.right);
                QCOMPARE(fromRight, m.left);
            } else {
                QCOMPARE(pos.left, 10.0);
                QCOMPARE(pos.right, 180.0);
                QCOMPARE(fromLeft, m.left);
                QCOMPARE(fromRight, m.right);
            }
            QCOMPARE(pos.bottom, 297.0 - m.bottom);
        }
    }

    void rulerTicksEveryTenMillimeters() {
        const QVector<TickMark> ticks = rulerTicks(210.0, 1.0);
        QCOMPARE(ticks.size(), 22);
        QVERIFY(ticks.at(0).isMajor);
        QVERIFY(!ticks.at(1).isMajor);
        QVERIFY(ticks.at(5).isMajor);
        QCOMPARE(ticks.last().valueMm, 210);
        QVERIFY(near(ticks.at(1).position, 10.0 * MM_TO_PX));
        QVERIFY(rulerTicks(-1.0, 1.0).isEmpty());
    }

    void pageSizeNames() {
        QCOMPARE(pageSizeFromName("letter"), PageSize::Letter);
        QCOMPARE(pageSizeFromName(" Custom "), PageSize::Custom);
        QCOMPARE(pageSizeFromName("tabloid"), PageSize::A4);
        QCOMPARE(pageSizeName(PageSize::Letter), QString("Letter"));
    }
};

QTEST_MAIN(PageGeometryTests)
#include "pagegeometry_test.moc"
