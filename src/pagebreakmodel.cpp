#include "pagebreakmodel.h"
#include "contentsurface.h"

#include <QDebug>
#include <algorithm>
#include <cmath>

namespace {

using MarkerPosition = PageBreakModel::MarkerPosition;

QVector<MarkerPosition> resolveMarkers(const Document &document,
                                       const IContentSurface *surface,
                                       qreal marginTop)
{
    QVector<MarkerPosition> result;
    const bool useSurface = surface && surface->isReady();
    for (const DocumentNode &node : document.nodes()) {
        if (!node.isPageBreak()) {
            continue;
        }
        MarkerPosition entry;
        entry.id = node.marker.id;
        if (useSurface) {
            const QRectF rect = surface->rectForOffset(node.marker.offset);
            if (!rect.isNull() && std::isfinite(rect.bottom())) {
                entry.position = rect.bottom() + marginTop;
                entry.resolved = true;
            }
        } else if (node.height > 0.0) {
            entry.position = node.bottom() + marginTop;
            entry.resolved = true;
        }
        result.append(entry);
    }
    return result;
}

} // namespace

PageBreakModel::PageBreakModel(QObject *parent)
    : QObject(parent)
{
}

QString PageBreakModel::pageLabel(int index) const
{
    const int total = pageCount();
    return tr("Page %1 of %2").arg(qBound(0, index, total - 1) + 1).arg(total);
}

QVector<qreal> PageBreakModel::getPageBreakPositions(const Document &document,
                                                     const IContentSurface &surface,
                                                     qreal marginTop) const
{
    QVector<qreal> positions;
    for (const MarkerPosition &entry : resolveMarkers(document, &surface, marginTop)) {
        if (entry.resolved) {
            positions.append(entry.position);
        }
    }
    std::sort(positions.begin(), positions.end());
    return positions;
}

QString PageBreakModel::insertPageBreak(Document &document, int atOffset, bool manual) const
{
    const QString id = document.insertPageBreak(atOffset, manual);
    qDebug() << "[PageBreakModel] Inserted page break" << id << "at offset" << atOffset;
    return id;
}

bool PageBreakModel::removePageBreak(Document &document, const QString &markerId) const
{
    const bool removed = document.removePageBreak(markerId);
    if (!removed) {
        qDebug() << "[PageBreakModel] No page break with id" << markerId;
    }
    return removed;
}

QVector<Page> PageBreakModel::splitIntoPages(const Document &document,
                                             const QVector<qreal> &breakPositions,
                                             qreal marginTop) const
{
    QVector<Page> pages;
    Page current;
    int nextBreak = 0;

    auto closePage = [&pages, &current]() {
        current.index = pages.size();
        current.id = QStringLiteral("page-%1").arg(current.index + 1);
        pages.append(current);
        current = Page();
    };

    for (const DocumentNode &node : document.nodes()) {
        if (node.isPageBreak()) {
            // Text typed into the marker block sits above the break line
            if (!node.text.isEmpty()) {
                current.content.append(node);
            }
            closePage();
            const qreal markerBottom = node.bottom() + marginTop;
            while (nextBreak < breakPositions.size()
                   && breakPositions.at(nextBreak) <= markerBottom + kDuplicateBreakTolerancePx) {
                ++nextBreak;
            }
            continue;
        }

        const qreal nodeTop = node.top + marginTop;
        while (nextBreak < breakPositions.size()
               && nodeTop >= breakPositions.at(nextBreak) - kDuplicateBreakTolerancePx) {
            closePage();
            ++nextBreak;
        }
        current.content.append(node);
    }

    closePage();
    return pages;
}

QVector<qreal> PageBreakModel::mergeBreakPositions(const QVector<qreal> &manual,
                                                   const QVector<qreal> &automatic)
{
    QVector<qreal> merged = manual;
    for (qreal position : automatic) {
        const bool duplicate = std::any_of(manual.cbegin(), manual.cend(), [position](qreal m) {
            return std::abs(m - position) < kDuplicateBreakTolerancePx;
        });
        if (!duplicate) {
            merged.append(position);
        }
    }
    std::sort(merged.begin(), merged.end());
    merged.erase(std::unique(merged.begin(), merged.end(), [](qreal a, qreal b) {
        return std::abs(a - b) < kDuplicateBreakTolerancePx;
    }), merged.end());
    return merged;
}

void PageBreakModel::reconcile(Document &document,
                               const Pagination::OverflowInfo &overflow,
                               const IContentSurface *surface,
                               qreal marginTop)
{
    // Offsets are resolved against the surface before pruning shifts them
    QVector<MarkerPosition> markers = resolveMarkers(document, surface, marginTop);

    const QStringList pruned = pruneOrphans(document);
    if (!pruned.isEmpty()) {
        qDebug() << "[PageBreakModel] Pruned orphaned markers:" << pruned;
        markers.erase(std::remove_if(markers.begin(), markers.end(), [&pruned](const MarkerPosition &entry) {
            return pruned.contains(entry.id);
        }), markers.end());
        emit markersPruned(pruned);
    }

    QVector<qreal> manual;
    for (const MarkerPosition &entry : markers) {
        if (entry.resolved) {
            manual.append(entry.position);
        } else {
            qDebug() << "[PageBreakModel] Marker" << entry.id << "has no measurable position yet";
        }
    }
    std::sort(manual.begin(), manual.end());

    const QVector<qreal> merged = mergeBreakPositions(manual, overflow.pageBreakPositions);
    m_manualPositions = manual;
    renumberMarkers(document, markers, merged);

    const bool changed = merged != m_breakPositions;
    m_breakPositions = merged;

    const bool multi = !markers.isEmpty() || overflow.pageCount > 1;
    setState(multi ? State::MultiPage : State::SinglePage);

    if (changed) {
        emit breakPositionsChanged(m_breakPositions);
    }
}

void PageBreakModel::reset()
{
    const bool hadBreaks = !m_breakPositions.isEmpty();
    m_breakPositions.clear();
    m_manualPositions.clear();
    setState(State::Unpaginated);
    if (hadBreaks) {
        emit breakPositionsChanged(m_breakPositions);
    }
}

QStringList PageBreakModel::pruneOrphans(Document &document) const
{
    QVector<int> orphaned;
    for (int i = 0; i < document.nodeCount(); ++i) {
        if (document.isMarkerOrphaned(i)) {
            orphaned.append(i);
        }
    }

    QStringList pruned;
    for (int k = orphaned.size() - 1; k >= 0; --k) {
        pruned.prepend(document.nodes().at(orphaned.at(k)).marker.id);
        document.removeNode(orphaned.at(k));
    }
    return pruned;
}

void PageBreakModel::renumberMarkers(Document &document,
                                     const QVector<MarkerPosition> &markers,
                                     const QVector<qreal> &merged) const
{
    int previousPage = 1;
    for (const MarkerPosition &entry : markers) {
        int pageNumber = previousPage + 1;
        if (entry.resolved) {
            const qreal position = entry.position;
            pageNumber = 1 + static_cast<int>(std::count_if(merged.cbegin(), merged.cend(), [position](qreal p) {
                return p <= position + kDuplicateBreakTolerancePx;
            }));
        }
        document.setMarkerPageNumber(entry.id, pageNumber);
        previousPage = pageNumber;
    }
}

void PageBreakModel::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    qDebug() << "[PageBreakModel] State ->" << state;
    emit stateChanged(state);
}
