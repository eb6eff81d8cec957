#pragma once

#include <QVector>
#include <QtGlobal>

// A vertical slice of the flowed content belonging to one printed page.
// Offsets are content coordinates (first line = 0).
struct PrintPage {
    int index = 0;
    qreal startOffset = 0.0;
    qreal endOffset = 0.0;
    qreal translateY = 0.0; // -startOffset
    qreal height = 0.0;     // endOffset - startOffset
};

namespace PrintCompositor {

// breakPositions are page-frame coordinates as published by the page-break
// model; marginTop converts them back to content coordinates.
QVector<PrintPage> slicePages(qreal contentHeight,
                              const QVector<qreal> &breakPositions,
                              qreal marginTop = 0.0);

} // namespace PrintCompositor
