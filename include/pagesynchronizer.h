#pragma once

#include <QObject>
#include <QRectF>
#include <QVector>

class QTimer;

class PageSynchronizer : public QObject {
    Q_OBJECT
public:
    enum class Source {
        Scroll,
        Cursor,
        Navigation
    };
    Q_ENUM(Source)

    struct PageEvent {
        Source source = Source::Scroll;
        qreal value = 0.0; // scroll offset, caret top, or requested page index
    };

    static constexpr qreal SCROLL_THRESHOLD_PX = 150.0;
    static constexpr qreal NAVIGATION_OFFSET_PX = 50.0;
    static constexpr int FRAME_INTERVAL_MS = 16;
    static constexpr int SCROLL_SETTLE_MS = 1000;

    explicit PageSynchronizer(QObject *parent = nullptr);

    static int detectCurrentPageByScroll(qreal scrollTop,
                                         const QVector<qreal> &breakPositions,
                                         qreal viewportHeight,
                                         qreal totalHeight,
                                         qreal threshold = SCROLL_THRESHOLD_PX);
    static int detectCurrentPageByCursor(const QRectF &caretRect,
                                         const QVector<qreal> &breakPositions,
                                         qreal availableHeight,
                                         qreal marginTop);
    static qreal scrollToPage(int pageIndex,
                              const QVector<qreal> &breakPositions,
                              qreal availableHeight,
                              qreal marginTop,
                              qreal viewportHeight);
    static int validatePageIndex(int index, int pageCount);

    void setPagination(const QVector<qreal> &breakPositions, qreal availableHeight, qreal marginTop);
    void setViewport(qreal viewportHeight, qreal totalHeight);

    // Single entry point for scroll, caret and navigation updates.
    void handleEvent(const PageEvent &event);

    int currentPage() const { return m_currentPage; }
    int pageCount() const { return m_breakPositions.size() + 1; }
    bool canGoNext() const { return m_currentPage < pageCount() - 1; }
    bool canGoPrevious() const { return m_currentPage > 0; }
    bool isScrollGuardActive() const { return m_scrollGuard; }
    bool isCursorGuardActive() const { return m_cursorGuard; }

public slots:
    void nextPage();
    void previousPage();
    void goToPage(int pageIndex);
    // Called by the view once a programmatic scroll has finished.
    void notifyScrollEnded();

signals:
    void currentPageChanged(int page, PageSynchronizer::Source source);
    void scrollRequested(qreal offset);
    // Emitted once per accepted caret event; the view keeps the caret visible.
    void revealCaretRequested();

private:
    void handleScroll(qreal scrollTop);
    void handleCursor(qreal caretTop);
    void handleNavigation(int pageIndex);
    void setCurrentPage(int page, Source source);
    void armScrollGuard();
    void releaseGuards();

    QVector<qreal> m_breakPositions;
    qreal m_availableHeight = 0.0;
    qreal m_marginTop = 0.0;
    qreal m_viewportHeight = 0.0;
    qreal m_totalHeight = 0.0;
    int m_currentPage = 0;

    bool m_scrollGuard = false;  // programmatic scroll in flight
    bool m_cursorGuard = false;  // caret-driven pass in flight
    qreal m_pendingScroll = 0.0;
    QTimer *m_frameTimer = nullptr;
    QTimer *m_settleTimer = nullptr;
};
