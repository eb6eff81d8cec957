#pragma once

#include <QVector>
#include <QtGlobal>

#include "pagegeometry.h"

namespace Pagination {

// Break refinement never moves a break further up than this.
constexpr qreal SNAP_SEARCH_WINDOW_PX = 150.0;
// Minimum lines of a text block kept on each side of a break.
constexpr int MIN_LINES_AROUND_BREAK = 2;

struct OverflowInfo {
    bool isOverflowing = false;
    qreal overflowAmount = 0.0;
    int pageCount = 1;
    qreal contentHeight = 0.0;
    qreal availableHeight = 0.0;
    // Ascending, pageCount - 1 entries, measured from the top of the page frame
    QVector<qreal> pageBreakPositions;

    bool operator==(const OverflowInfo &other) const;
    bool operator!=(const OverflowInfo &other) const { return !(*this == other); }
};

// A rendered block of flowed content. top/height are measured from the
// top of the flowed content (first line = 0), not from the page edge.
struct BlockExtent {
    enum Kind {
        TextBlock,   // paragraph, heading, list item: may split between lines
        AtomicBlock  // table row, image, rule: never split
    };

    qreal top = 0.0;
    qreal height = 0.0;
    qreal lineHeight = 0.0;
    Kind kind = TextBlock;

    qreal bottom() const { return top + height; }
    int lineCount() const;
};

qreal sanitizeHeight(qreal height);

OverflowInfo calculateOverflowInfo(qreal measuredContentHeight,
                                   const PageGeometry::ContentDimensions &content);

// Same page count as the naive variant. Each break lies at most one
// availableHeight below the previous one and is snapped to a block boundary
// that respects the orphan/widow policy when one lies in range and the
// remaining pages can still hold the rest of the content.
OverflowInfo calculateOverflowInfo(qreal measuredContentHeight,
                                   const PageGeometry::ContentDimensions &content,
                                   const QVector<BlockExtent> &blocks);

QVector<qreal> naiveBreakPositions(int pageCount, qreal availableHeight, qreal marginTop);

// Returns the refined position for a single break, or naivePosition when no
// acceptable snap point exists above it.
qreal refineBreakPosition(qreal naivePosition,
                          qreal previousBreak,
                          qreal marginTop,
                          const QVector<BlockExtent> &blocks);

} // namespace Pagination
