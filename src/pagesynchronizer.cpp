#include "pagesynchronizer.h"

#include <QDebug>
#include <QTimer>
#include <algorithm>
#include <cmath>

PageSynchronizer::PageSynchronizer(QObject *parent)
    : QObject(parent)
{
    m_frameTimer = new QTimer(this);
    m_frameTimer->setSingleShot(true);
    m_frameTimer->setInterval(FRAME_INTERVAL_MS);
    connect(m_frameTimer, &QTimer::timeout, this, [this] {
        emit scrollRequested(m_pendingScroll);
    });

    m_settleTimer = new QTimer(this);
    m_settleTimer->setSingleShot(true);
    m_settleTimer->setInterval(SCROLL_SETTLE_MS);
    connect(m_settleTimer, &QTimer::timeout, this, &PageSynchronizer::releaseGuards);
}

int PageSynchronizer::detectCurrentPageByScroll(qreal scrollTop,
                                                const QVector<qreal> &breakPositions,
                                                qreal viewportHeight,
                                                qreal totalHeight,
                                                qreal threshold)
{
    if (breakPositions.isEmpty() || !std::isfinite(scrollTop) || scrollTop < threshold) {
        return 0;
    }

    int detected = 0;
    for (int i = 0; i < breakPositions.size(); ++i) {
        if (scrollTop >= breakPositions.at(i) - threshold) {
            detected = i + 1;
        }
    }

    // Scrolled to the bottom: the last page is current even if its top is not reached
    if (totalHeight > 0.0 && scrollTop + viewportHeight >= totalHeight - threshold) {
        detected = std::max(detected, static_cast<int>(breakPositions.size()));
    }
    return detected;
}

int PageSynchronizer::detectCurrentPageByCursor(const QRectF &caretRect,
                                                const QVector<qreal> &breakPositions,
                                                qreal availableHeight,
                                                qreal marginTop)
{
    const qreal caretTop = caretRect.top();
    if (!std::isfinite(caretTop)) {
        return 0;
    }

    if (breakPositions.isEmpty()) {
        if (availableHeight <= 0.0 || caretTop < marginTop + availableHeight) {
            return 0;
        }
        return static_cast<int>(std::floor((caretTop - marginTop) / availableHeight));
    }

    for (int i = 0; i < breakPositions.size(); ++i) {
        if (caretTop < breakPositions.at(i)) {
            return i;
        }
    }
    return breakPositions.size();
}

qreal PageSynchronizer::scrollToPage(int pageIndex,
                                     const QVector<qreal> &breakPositions,
                                     qreal availableHeight,
                                     qreal marginTop,
                                     qreal viewportHeight)
{
    Q_UNUSED(viewportHeight);
    if (pageIndex <= 0) {
        return 0.0;
    }
    qreal target = 0.0;
    if (pageIndex - 1 < breakPositions.size()) {
        target = breakPositions.at(pageIndex - 1) - NAVIGATION_OFFSET_PX;
    } else {
        target = pageIndex * (availableHeight + marginTop) - NAVIGATION_OFFSET_PX;
    }
    if (!std::isfinite(target)) {
        return 0.0;
    }
    return std::max<qreal>(0.0, target);
}

int PageSynchronizer::validatePageIndex(int index, int pageCount)
{
    if (pageCount <= 1) {
        return 0;
    }
    return qBound(0, index, pageCount - 1);
}

void PageSynchronizer::setPagination(const QVector<qreal> &breakPositions,
                                     qreal availableHeight,
                                     qreal marginTop)
{
    m_breakPositions = breakPositions;
    m_availableHeight = availableHeight;
    m_marginTop = marginTop;

    const int clamped = validatePageIndex(m_currentPage, pageCount());
    if (clamped != m_currentPage) {
        setCurrentPage(clamped, Source::Navigation);
    }
}

void PageSynchronizer::setViewport(qreal viewportHeight, qreal totalHeight)
{
    m_viewportHeight = viewportHeight;
    m_totalHeight = totalHeight;
}

void PageSynchronizer::handleEvent(const PageEvent &event)
{
    if (pageCount() <= 1) {
        setCurrentPage(0, event.source);
        if (event.source == Source::Cursor) {
            emit revealCaretRequested();
        }
        return;
    }

    switch (event.source) {
    case Source::Scroll:
        handleScroll(event.value);
        break;
    case Source::Cursor:
        handleCursor(event.value);
        break;
    case Source::Navigation:
        handleNavigation(static_cast<int>(event.value));
        break;
    }
}

void PageSynchronizer::nextPage()
{
    if (canGoNext()) {
        handleEvent({Source::Navigation, static_cast<qreal>(m_currentPage + 1)});
    }
}

void PageSynchronizer::previousPage()
{
    if (canGoPrevious()) {
        handleEvent({Source::Navigation, static_cast<qreal>(m_currentPage - 1)});
    }
}

void PageSynchronizer::goToPage(int pageIndex)
{
    handleEvent({Source::Navigation, static_cast<qreal>(pageIndex)});
}

void PageSynchronizer::notifyScrollEnded()
{
    if ((!m_scrollGuard && !m_cursorGuard) || m_frameTimer->isActive()) {
        return;
    }
    m_settleTimer->stop();
    releaseGuards();
}

void PageSynchronizer::handleScroll(qreal scrollTop)
{
    if (m_scrollGuard) {
        qDebug() << "[PageSynchronizer] Scroll event suppressed during programmatic scroll";
        return;
    }
    const int page = detectCurrentPageByScroll(scrollTop, m_breakPositions, m_viewportHeight, m_totalHeight);
    setCurrentPage(validatePageIndex(page, pageCount()), Source::Scroll);
}

void PageSynchronizer::handleCursor(qreal caretTop)
{
    if (m_cursorGuard) {
        qDebug() << "[PageSynchronizer] Caret event suppressed, caret pass in flight";
        return;
    }

    m_cursorGuard = true;
    const QRectF caret(0.0, caretTop, 1.0, 1.0);
    const int page = validatePageIndex(
        detectCurrentPageByCursor(caret, m_breakPositions, m_availableHeight, m_marginTop), pageCount());

    if (page == m_currentPage) {
        m_cursorGuard = false;
    } else {
        setCurrentPage(page, Source::Cursor);
    }

    // The view scrolls to the caret; scroll detection waits until that settles.
    armScrollGuard();
    emit revealCaretRequested();
}

void PageSynchronizer::handleNavigation(int pageIndex)
{
    const int target = validatePageIndex(pageIndex, pageCount());
    setCurrentPage(target, Source::Navigation);

    m_pendingScroll = scrollToPage(target, m_breakPositions, m_availableHeight, m_marginTop, m_viewportHeight);
    armScrollGuard();
    m_frameTimer->start();
}

void PageSynchronizer::setCurrentPage(int page, Source source)
{
    if (page == m_currentPage) {
        return;
    }
    m_currentPage = page;
    emit currentPageChanged(page, source);
}

void PageSynchronizer::armScrollGuard()
{
    m_scrollGuard = true;
    m_settleTimer->start();
}

void PageSynchronizer::releaseGuards()
{
    m_scrollGuard = false;
    m_cursorGuard = false;
}
