#include "pagesetupstore.h"

#include <QDebug>
#include <QSettings>

namespace PageSetupStore {

namespace {

const char *kGroup = "pageSetup";

double readDouble(QSettings &settings, const QString &key, double fallback)
{
    bool ok = false;
    const double value = settings.value(key, fallback).toDouble(&ok);
    return ok ? value : fallback;
}

} // namespace

PageSetup load(QSettings &settings)
{
    using namespace PageGeometry;

    PageSetup setup;
    settings.beginGroup(QLatin1String(kGroup));

    PageLayout layout;
    layout.pageSize = pageSizeFromName(settings.value("pageSize", pageSizeName(PageSize::A4)).toString());
    layout.customWidth = readDouble(settings, "customWidth", A4_WIDTH_MM);
    layout.customHeight = readDouble(settings, "customHeight", A4_HEIGHT_MM);
    layout.orientation = settings.value("orientation", "portrait").toString() == QLatin1String("landscape")
        ? Orientation::Landscape
        : Orientation::Portrait;
    layout.margins.top = readDouble(settings, "marginTop", DEFAULT_MARGIN_MM);
    layout.margins.bottom = readDouble(settings, "marginBottom", DEFAULT_MARGIN_MM);
    layout.margins.left = readDouble(settings, "marginLeft", DEFAULT_MARGIN_MM);
    layout.margins.right = readDouble(settings, "marginRight", DEFAULT_MARGIN_MM);
    layout.showMarginGuides = settings.value("showMarginGuides", true).toBool();
    setup.layout = sanitizeLayout(layout);

    setup.unit = settings.value("unit", "mm").toString() == QLatin1String("in")
        ? MarginUnit::Inches
        : MarginUnit::Millimeters;
    setup.zoom = clampZoom(readDouble(settings, "zoom", DEFAULT_ZOOM));
    setup.rtl = settings.value("rtl", true).toBool();

    settings.endGroup();
    qDebug() << "[PageSetupStore] Loaded" << pageSizeName(setup.layout.pageSize)
             << "zoom" << setup.zoom << "rtl" << setup.rtl;
    return setup;
}

bool save(QSettings &settings, const PageSetup &setup)
{
    using namespace PageGeometry;

    const PageLayout layout = sanitizeLayout(setup.layout);
    settings.beginGroup(QLatin1String(kGroup));
    settings.setValue("pageSize", pageSizeName(layout.pageSize));
    settings.setValue("customWidth", layout.customWidth);
    settings.setValue("customHeight", layout.customHeight);
    settings.setValue("orientation", layout.orientation == Orientation::Landscape ? "landscape" : "portrait");
    settings.setValue("marginTop", layout.margins.top);
    settings.setValue("marginBottom", layout.margins.bottom);
    settings.setValue("marginLeft", layout.margins.left);
    settings.setValue("marginRight", layout.margins.right);
    settings.setValue("showMarginGuides", layout.showMarginGuides);
    settings.setValue("unit", setup.unit == MarginUnit::Inches ? "in" : "mm");
    settings.setValue("zoom", clampZoom(setup.zoom));
    settings.setValue("rtl", setup.rtl);
    settings.endGroup();

    settings.sync();
    if (settings.status() != QSettings::NoError) {
        qWarning() << "[PageSetupStore] Failed to write settings to" << settings.fileName();
        return false;
    }
    return true;
}

PageSetup load()
{
    QSettings settings("SafhaQt", "SafhaQt");
    return load(settings);
}

bool save(const PageSetup &setup)
{
    QSettings settings("SafhaQt", "SafhaQt");
    return save(settings, setup);
}

} // namespace PageSetupStore
