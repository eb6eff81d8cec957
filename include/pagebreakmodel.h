#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include "document.h"
#include "overflowcalculator.h"

class IContentSurface;

struct Page {
    QString id;
    int index = 0;
    QVector<DocumentNode> content;
};

class PageBreakModel : public QObject {
    Q_OBJECT
public:
    enum class State {
        Unpaginated,
        SinglePage,
        MultiPage
    };
    Q_ENUM(State)

    // Manual and automatic breaks closer than this count as one boundary
    static constexpr qreal kDuplicateBreakTolerancePx = 1.0;

    explicit PageBreakModel(QObject *parent = nullptr);

    State state() const { return m_state; }
    int pageCount() const { return m_breakPositions.size() + 1; }
    const QVector<qreal> &breakPositions() const { return m_breakPositions; }
    const QVector<qreal> &manualBreakPositions() const { return m_manualPositions; }
    QString pageLabel(int index) const;

    // Pixel positions (page-frame coordinates) of the document's manual markers.
    QVector<qreal> getPageBreakPositions(const Document &document,
                                         const IContentSurface &surface,
                                         qreal marginTop) const;

    QString insertPageBreak(Document &document, int atOffset, bool manual = true) const;
    bool removePageBreak(Document &document, const QString &markerId) const;

    // Splits top-level nodes into pages at manual markers and at the given
    // pixel positions. A node belongs to the page on which it starts.
    QVector<Page> splitIntoPages(const Document &document,
                                 const QVector<qreal> &breakPositions,
                                 qreal marginTop = 0.0) const;

    static QVector<qreal> mergeBreakPositions(const QVector<qreal> &manual,
                                              const QVector<qreal> &automatic);

    // Prunes orphaned markers from document, merges manual positions with
    // the automatic ones from overflow, renumbers markers and updates state.
    // surface may be null, in which case manual markers carry no position.
    void reconcile(Document &document,
                   const Pagination::OverflowInfo &overflow,
                   const IContentSurface *surface,
                   qreal marginTop);

    void reset();

    struct MarkerPosition {
        QString id;
        qreal position = 0.0;
        bool resolved = false;
    };

signals:
    void stateChanged(PageBreakModel::State state);
    void breakPositionsChanged(const QVector<qreal> &positions);
    void markersPruned(const QStringList &markerIds);

private:
    QStringList pruneOrphans(Document &document) const;
    void renumberMarkers(Document &document,
                         const QVector<MarkerPosition> &markers,
                         const QVector<qreal> &merged) const;
    void setState(State state);

    State m_state = State::Unpaginated;
    QVector<qreal> m_breakPositions;
    QVector<qreal> m_manualPositions;
};
