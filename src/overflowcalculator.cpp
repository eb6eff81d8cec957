#include "overflowcalculator.h"

#include <QDebug>
#include <algorithm>
#include <cmath>

namespace Pagination {

namespace {

const qreal kPositionEpsilon = 0.5;

const BlockExtent *blockContaining(qreal contentY, const QVector<BlockExtent> &blocks)
{
    for (const BlockExtent &block : blocks) {
        if (contentY > block.top && contentY < block.bottom()) {
            return &block;
        }
    }
    return nullptr;
}

// Line boundary (content coordinates) at or above contentY inside a text block,
// moved up as needed so at least MIN_LINES_AROUND_BREAK lines stay on each side.
qreal textBlockSnapPoint(const BlockExtent &block, qreal contentY)
{
    const int totalLines = block.lineCount();
    if (totalLines < 2 * MIN_LINES_AROUND_BREAK || block.lineHeight <= 0.0) {
        return block.top;
    }

    int linesBefore = static_cast<int>(std::floor((contentY - block.top) / block.lineHeight));
    linesBefore = std::min(linesBefore, totalLines - MIN_LINES_AROUND_BREAK);
    if (linesBefore < MIN_LINES_AROUND_BREAK) {
        return block.top;
    }
    return block.top + linesBefore * block.lineHeight;
}

} // namespace

bool OverflowInfo::operator==(const OverflowInfo &other) const
{
    return isOverflowing == other.isOverflowing
        && qFuzzyCompare(1.0 + overflowAmount, 1.0 + other.overflowAmount)
        && pageCount == other.pageCount
        && qFuzzyCompare(1.0 + contentHeight, 1.0 + other.contentHeight)
        && qFuzzyCompare(1.0 + availableHeight, 1.0 + other.availableHeight)
        && pageBreakPositions == other.pageBreakPositions;
}

int BlockExtent::lineCount() const
{
    if (lineHeight <= 0.0 || !std::isfinite(lineHeight)) {
        return 1;
    }
    return std::max(1, static_cast<int>(std::lround(height / lineHeight)));
}

qreal sanitizeHeight(qreal height)
{
    if (!std::isfinite(height) || height < 0.0) {
        return 0.0;
    }
    return height;
}

QVector<qreal> naiveBreakPositions(int pageCount, qreal availableHeight, qreal marginTop)
{
    QVector<qreal> positions;
    if (pageCount <= 1 || availableHeight <= 0.0) {
        return positions;
    }
    positions.reserve(pageCount - 1);
    for (int i = 1; i < pageCount; ++i) {
        positions.append(i * availableHeight + marginTop);
    }
    return positions;
}

OverflowInfo calculateOverflowInfo(qreal measuredContentHeight,
                                   const PageGeometry::ContentDimensions &content)
{
    OverflowInfo info;
    info.contentHeight = sanitizeHeight(measuredContentHeight);

    const qreal available = content.availableHeight();
    if (!std::isfinite(available) || available <= 0.0) {
        qDebug() << "[Pagination] Degenerate available height" << available << "- single page";
        info.availableHeight = 0.0;
        return info;
    }

    info.availableHeight = available;
    info.pageCount = std::max(1, static_cast<int>(std::ceil(info.contentHeight / available)));
    info.isOverflowing = info.pageCount > 1;
    info.overflowAmount = std::max<qreal>(0.0, info.contentHeight - available);

    const qreal marginTop = std::isfinite(content.marginTop) ? content.marginTop : 0.0;
    info.pageBreakPositions = naiveBreakPositions(info.pageCount, available, marginTop);
    return info;
}

OverflowInfo calculateOverflowInfo(qreal measuredContentHeight,
                                   const PageGeometry::ContentDimensions &content,
                                   const QVector<BlockExtent> &blocks)
{
    OverflowInfo info = calculateOverflowInfo(measuredContentHeight, content);
    if (info.pageBreakPositions.isEmpty() || blocks.isEmpty()) {
        return info;
    }

    const qreal available = info.availableHeight;
    const qreal marginTop = std::isfinite(content.marginTop) ? content.marginTop : 0.0;
    const qreal contentEnd = info.contentHeight + marginTop;
    qreal previous = marginTop;
    for (int i = 0; i < info.pageBreakPositions.size(); ++i) {
        // Each page holds at most availableHeight, measured from the previous break
        const qreal naive = previous + available;
        qreal position = refineBreakPosition(naive, previous, marginTop, blocks);

        // The pages left after this break must still hold the rest of the content
        const int pagesAfter = info.pageCount - (i + 1);
        if (contentEnd - position > pagesAfter * available + kPositionEpsilon) {
            position = naive;
        }
        info.pageBreakPositions[i] = position;
        previous = position;
    }
    return info;
}

qreal refineBreakPosition(qreal naivePosition,
                          qreal previousBreak,
                          qreal marginTop,
                          const QVector<BlockExtent> &blocks)
{
    const qreal contentY = naivePosition - marginTop;
    const BlockExtent *block = blockContaining(contentY, blocks);
    if (!block) {
        return naivePosition;
    }

    const qreal snapY = block->kind == BlockExtent::AtomicBlock
        ? block->top
        : textBlockSnapPoint(*block, contentY);
    const qreal candidate = snapY + marginTop;

    if (naivePosition - candidate > SNAP_SEARCH_WINDOW_PX) {
        return naivePosition;
    }
    if (candidate <= previousBreak + kPositionEpsilon) {
        return naivePosition;
    }
    return candidate;
}

} // namespace Pagination
