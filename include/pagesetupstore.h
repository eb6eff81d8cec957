#pragma once

#include "pagegeometry.h"

class QSettings;

namespace PageSetupStore {

// Editor preferences restored between sessions.
struct PageSetup {
    PageGeometry::PageLayout layout;
    PageGeometry::MarginUnit unit = PageGeometry::MarginUnit::Millimeters;
    double zoom = PageGeometry::DEFAULT_ZOOM;
    bool rtl = true;
};

PageSetup load(QSettings &settings);
bool save(QSettings &settings, const PageSetup &setup);

// Use the application's default settings location.
PageSetup load();
bool save(const PageSetup &setup);

} // namespace PageSetupStore
