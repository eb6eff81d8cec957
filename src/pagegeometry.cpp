#include "pagegeometry.h"

#include <QDebug>
#include <QtGlobal>
#include <algorithm>
#include <cmath>

namespace PageGeometry {

namespace {

PageDimensions a4Portrait()
{
    PageDimensions dims;
    dims.widthMm = A4_WIDTH_MM;
    dims.heightMm = A4_HEIGHT_MM;
    dims.width = A4_WIDTH_MM * MM_TO_PX;
    dims.height = A4_HEIGHT_MM * MM_TO_PX;
    return dims;
}

bool isUsableLength(double value)
{
    return std::isfinite(value) && value > 0.0;
}

// Shrinks a pair of opposing margins so the page keeps a minimum content extent.
void fitOpposingMargins(double &first, double &second, double pageExtentMm)
{
    const double allowed = std::max(0.0, pageExtentMm - MIN_CONTENT_EXTENT_MM);
    const double total = first + second;
    if (total <= allowed || total <= 0.0) {
        return;
    }
    const double scale = allowed / total;
    first *= scale;
    second *= scale;
}

} // namespace

bool Margins::operator==(const Margins &other) const
{
    return qFuzzyCompare(1.0 + top, 1.0 + other.top)
        && qFuzzyCompare(1.0 + bottom, 1.0 + other.bottom)
        && qFuzzyCompare(1.0 + left, 1.0 + other.left)
        && qFuzzyCompare(1.0 + right, 1.0 + other.right);
}

bool PageDimensions::isValid() const
{
    return isUsableLength(width) && isUsableLength(height)
        && isUsableLength(widthMm) && isUsableLength(heightMm);
}

double mmToPx(double mm, double zoom)
{
    if (!isUsableLength(zoom)) {
        zoom = DEFAULT_ZOOM;
    }
    if (!std::isfinite(mm)) {
        return 0.0;
    }
    return mm * MM_TO_PX * zoom;
}

double pxToMm(double px, double zoom)
{
    if (!isUsableLength(zoom)) {
        zoom = DEFAULT_ZOOM;
    }
    if (!std::isfinite(px)) {
        return 0.0;
    }
    return px * PX_TO_MM / zoom;
}

double mmToInches(double mm)
{
    return mm / MM_PER_INCH;
}

double inchesToMm(double inches)
{
    return inches * MM_PER_INCH;
}

double toDisplayUnit(double mm, MarginUnit unit)
{
    return unit == MarginUnit::Inches ? mmToInches(mm) : mm;
}

double fromDisplayUnit(double value, MarginUnit unit)
{
    return unit == MarginUnit::Inches ? inchesToMm(value) : value;
}

QString formatDimension(double value, MarginUnit unit)
{
    if (unit == MarginUnit::Inches) {
        return QString::number(value, 'f', 3);
    }
    return QString::number(qRound(value));
}

double clampMargin(double value, MarginUnit unit)
{
    const double maxMargin = unit == MarginUnit::Inches ? MAX_MARGIN_INCHES : MAX_MARGIN_MM;
    if (!std::isfinite(value)) {
        return unit == MarginUnit::Inches ? mmToInches(DEFAULT_MARGIN_MM) : DEFAULT_MARGIN_MM;
    }
    return qBound(MIN_MARGIN_MM, value, maxMargin);
}

double clampZoom(double zoom)
{
    if (!std::isfinite(zoom)) {
        return DEFAULT_ZOOM;
    }
    return qBound(MIN_ZOOM, zoom, MAX_ZOOM);
}

double clampCustomDimension(double mm, double fallbackMm)
{
    if (!isUsableLength(mm)) {
        return fallbackMm;
    }
    return qBound(MIN_CUSTOM_DIMENSION_MM, mm, MAX_CUSTOM_DIMENSION_MM);
}

Margins clampMargins(const Margins &margins)
{
    Margins clamped;
    clamped.top = clampMargin(margins.top);
    clamped.bottom = clampMargin(margins.bottom);
    clamped.left = clampMargin(margins.left);
    clamped.right = clampMargin(margins.right);
    return clamped;
}

PageLayout sanitizeLayout(const PageLayout &layout)
{
    PageLayout result = layout;
    result.customWidth = clampCustomDimension(layout.customWidth, A4_WIDTH_MM);
    result.customHeight = clampCustomDimension(layout.customHeight, A4_HEIGHT_MM);
    result.margins = clampMargins(layout.margins);

    const PageDimensions page = resolvePageDimensions(result);
    fitOpposingMargins(result.margins.left, result.margins.right, page.widthMm);
    fitOpposingMargins(result.margins.top, result.margins.bottom, page.heightMm);
    return result;
}

PageDimensions resolvePageDimensions(PageSize pageSize,
                                     double customWidth,
                                     double customHeight,
                                     Orientation orientation)
{
    double widthMm = A4_WIDTH_MM;
    double heightMm = A4_HEIGHT_MM;

    switch (pageSize) {
    case PageSize::A4:
        break;
    case PageSize::Letter:
        widthMm = LETTER_WIDTH_MM;
        heightMm = LETTER_HEIGHT_MM;
        break;
    case PageSize::Custom:
        if (!isUsableLength(customWidth) || !isUsableLength(customHeight)) {
            qWarning() << "[PageGeometry] Invalid custom page size" << customWidth << "x" << customHeight
                       << "- falling back to A4 portrait";
            return a4Portrait();
        }
        widthMm = qBound(MIN_CUSTOM_DIMENSION_MM, customWidth, MAX_CUSTOM_DIMENSION_MM);
        heightMm = qBound(MIN_CUSTOM_DIMENSION_MM, customHeight, MAX_CUSTOM_DIMENSION_MM);
        break;
    }

    if (orientation == Orientation::Landscape) {
        std::swap(widthMm, heightMm);
    }

    PageDimensions dims;
    dims.widthMm = widthMm;
    dims.heightMm = heightMm;
    dims.width = widthMm * MM_TO_PX;
    dims.height = heightMm * MM_TO_PX;
    if (!dims.isValid()) {
        qWarning() << "[PageGeometry] Non-finite page dimensions, falling back to A4 portrait";
        return a4Portrait();
    }
    return dims;
}

PageDimensions resolvePageDimensions(const PageLayout &layout)
{
    return resolvePageDimensions(layout.pageSize, layout.customWidth, layout.customHeight, layout.orientation);
}

ContentDimensions resolveContentDimensions(const PageDimensions &page,
                                           const Margins &margins,
                                           double zoom)
{
    const PageDimensions usable = page.isValid() ? page : a4Portrait();
    const double z = clampZoom(zoom);
    const Margins m = clampMargins(margins);

    ContentDimensions content;
    content.width = usable.width * z;
    content.height = usable.height * z;
    content.marginTop = mmToPx(m.top, z);
    content.marginBottom = mmToPx(m.bottom, z);
    content.marginLeft = mmToPx(m.left, z);
    content.marginRight = mmToPx(m.right, z);
    return content;
}

ContentPadding contentPadding(const Margins &margins, bool rtl)
{
    ContentPadding padding;
    padding.top = margins.top;
    padding.bottom = margins.bottom;
    if (rtl) {
        padding.left = margins.right;
        padding.right = margins.left;
    } else {
        padding.left = margins.left;
        padding.right = margins.right;
    }
    return padding;
}

HandlePositions rulerHandlePositions(const Margins &margins,
                                     double pageWidthMm,
                                     double pageHeightMm,
                                     bool rtl)
{
    HandlePositions pos;
    if (rtl) {
        pos.left = margins.right;
        pos.right = pageWidthMm - margins.left;
    } else {
        pos.left = margins.left;
        pos.right = pageWidthMm - margins.right;
    }
    pos.top = margins.top;
    pos.bottom = pageHeightMm - margins.bottom;
    return pos;
}

// Returns the margin controlled by the visual left handle: right under RTL, left otherwise.
double marginFromLeftHandle(double visualLeftMm, double pageWidthMm, bool rtl)
{
    Q_UNUSED(pageWidthMm);
    Q_UNUSED(rtl);
    return visualLeftMm;
}

// Returns the margin controlled by the visual right handle: left under RTL, right otherwise.
double marginFromRightHandle(double visualRightMm, double pageWidthMm, bool rtl)
{
    Q_UNUSED(rtl);
    return pageWidthMm - visualRightMm;
}

QVector<TickMark> rulerTicks(double lengthMm, double zoom)
{
    QVector<TickMark> ticks;
    if (!isUsableLength(lengthMm)) {
        return ticks;
    }
    const double z = clampZoom(zoom);
    for (int mm = 0; mm <= static_cast<int>(lengthMm); mm += RULER_MINOR_TICK_MM) {
        TickMark tick;
        tick.position = mmToPx(mm, z);
        tick.valueMm = mm;
        tick.isMajor = (mm % RULER_MAJOR_TICK_MM) == 0;
        ticks.append(tick);
    }
    return ticks;
}

QString pageSizeName(PageSize size)
{
    switch (size) {
    case PageSize::A4:
        return QStringLiteral("A4");
    case PageSize::Letter:
        return QStringLiteral("Letter");
    case PageSize::Custom:
        return QStringLiteral("Custom");
    }
    return QStringLiteral("A4");
}

PageSize pageSizeFromName(const QString &name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QLatin1String("letter")) return PageSize::Letter;
    if (normalized == QLatin1String("custom")) return PageSize::Custom;
    return PageSize::A4;
}

} // namespace PageGeometry
