#include "printcompositor.h"

#include <QDebug>
#include <algorithm>
#include <cmath>

namespace PrintCompositor {

QVector<PrintPage> slicePages(qreal contentHeight,
                              const QVector<qreal> &breakPositions,
                              qreal marginTop)
{
    const qreal total = std::isfinite(contentHeight) ? std::max<qreal>(0.0, contentHeight) : 0.0;
    const qreal offset = std::isfinite(marginTop) ? marginTop : 0.0;

    QVector<PrintPage> pages;
    pages.reserve(breakPositions.size() + 1);
    qreal start = 0.0;
    for (int i = 0; i <= breakPositions.size(); ++i) {
        qreal end = i < breakPositions.size() ? breakPositions.at(i) - offset : total;
        end = std::max(end, start);

        PrintPage page;
        page.index = i;
        page.startOffset = start;
        page.endOffset = end;
        page.translateY = start > 0.0 ? -start : 0.0;
        page.height = end - start;
        pages.append(page);

        start = end;
    }

    qDebug() << "[PrintCompositor] Sliced" << pages.size() << "pages from" << total << "px of content";
    return pages;
}

} // namespace PrintCompositor
