#pragma once

#include <QString>
#include <QVector>

namespace PageGeometry {

// 96 DPI: 1 mm = 3.7795275591 px
constexpr double MM_TO_PX = 3.7795275591;
constexpr double PX_TO_MM = 1.0 / MM_TO_PX;
constexpr double MM_PER_INCH = 25.4;

constexpr double A4_WIDTH_MM = 210.0;
constexpr double A4_HEIGHT_MM = 297.0;
constexpr double LETTER_WIDTH_MM = 216.0;
constexpr double LETTER_HEIGHT_MM = 279.0;

constexpr double MIN_MARGIN_MM = 0.0;
constexpr double MAX_MARGIN_MM = 50.0;
constexpr double MAX_MARGIN_INCHES = 2.0;
constexpr double MIN_CONTENT_EXTENT_MM = 10.0;
constexpr double MIN_CUSTOM_DIMENSION_MM = 50.0;
constexpr double MAX_CUSTOM_DIMENSION_MM = 1000.0;

constexpr double MIN_ZOOM = 0.25;
constexpr double MAX_ZOOM = 3.0;
constexpr double DEFAULT_ZOOM = 1.0;
constexpr double DEFAULT_MARGIN_MM = 20.0;

constexpr int RULER_MINOR_TICK_MM = 10;
constexpr int RULER_MAJOR_TICK_MM = 50;

enum class PageSize {
    A4,
    Letter,
    Custom
};

enum class Orientation {
    Portrait,
    Landscape
};

enum class MarginUnit {
    Millimeters,
    Inches
};

// Margins are always stored in millimeters.
struct Margins {
    double top = DEFAULT_MARGIN_MM;
    double bottom = DEFAULT_MARGIN_MM;
    double left = DEFAULT_MARGIN_MM;
    double right = DEFAULT_MARGIN_MM;

    bool operator==(const Margins &other) const;
    bool operator!=(const Margins &other) const { return !(*this == other); }
};

struct PageLayout {
    PageSize pageSize = PageSize::A4;
    double customWidth = A4_WIDTH_MM;   // mm, Custom only
    double customHeight = A4_HEIGHT_MM; // mm, Custom only
    Orientation orientation = Orientation::Portrait;
    Margins margins;
    bool showMarginGuides = true;
};

// Pixel size of a page at 1:1 scale.
struct PageDimensions {
    double width = 0.0;
    double height = 0.0;
    double widthMm = 0.0;
    double heightMm = 0.0;

    bool isValid() const;
};

// Page size and margins in pixels, scaled by zoom.
struct ContentDimensions {
    double width = 0.0;
    double height = 0.0;
    double marginTop = 0.0;
    double marginBottom = 0.0;
    double marginLeft = 0.0;
    double marginRight = 0.0;

    double availableHeight() const { return height - marginTop - marginBottom; }
    double availableWidth() const { return width - marginLeft - marginRight; }
};

// Padding applied to the content box (mm). Under RTL the semantic right
// margin pads the visual left edge and vice versa.
struct ContentPadding {
    double top = 0.0;
    double bottom = 0.0;
    double left = 0.0;
    double right = 0.0;
};

// Visual positions of ruler handles, in mm from the page's top-left corner.
struct HandlePositions {
    double left = 0.0;
    double right = 0.0;
    double top = 0.0;
    double bottom = 0.0;
};

struct TickMark {
    double position = 0.0; // px from the ruler origin
    int valueMm = 0;
    bool isMajor = false;
};

double mmToPx(double mm, double zoom = 1.0);
double pxToMm(double px, double zoom = 1.0);
double mmToInches(double mm);
double inchesToMm(double inches);

double toDisplayUnit(double mm, MarginUnit unit);
double fromDisplayUnit(double value, MarginUnit unit);
QString formatDimension(double value, MarginUnit unit);

double clampMargin(double value, MarginUnit unit = MarginUnit::Millimeters);
double clampZoom(double zoom);
double clampCustomDimension(double mm, double fallbackMm);
Margins clampMargins(const Margins &margins);
PageLayout sanitizeLayout(const PageLayout &layout);

PageDimensions resolvePageDimensions(PageSize pageSize,
                                     double customWidth,
                                     double customHeight,
                                     Orientation orientation);
PageDimensions resolvePageDimensions(const PageLayout &layout);
ContentDimensions resolveContentDimensions(const PageDimensions &page,
                                           const Margins &margins,
                                           double zoom);

ContentPadding contentPadding(const Margins &margins, bool rtl);
HandlePositions rulerHandlePositions(const Margins &margins,
                                     double pageWidthMm,
                                     double pageHeightMm,
                                     bool rtl);
double marginFromLeftHandle(double visualLeftMm, double pageWidthMm, bool rtl);
double marginFromRightHandle(double visualRightMm, double pageWidthMm, bool rtl);

QVector<TickMark> rulerTicks(double lengthMm, double zoom);

QString pageSizeName(PageSize size);
PageSize pageSizeFromName(const QString &name);

} // namespace PageGeometry
