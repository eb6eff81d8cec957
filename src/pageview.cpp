#include "pageview.h"
#include "contentsurface.h"
#include "marginruler.h"
#include "pagesynchronizer.h"
#include "pdfexporter.h"
#include "richtexteditor.h"
#include <QPainter>
#include <QAbstractTextDocumentLayout>
#include <QTextDocument>
#include <QFrame>
#include <QScrollArea>
#include <QScrollBar>
#include <QDebug>
#include <QTimer>
#include <algorithm>
#include <cmath>

PageView::PageView(QWidget *parent)
    : QWidget(parent),
      m_editor(new RichTextEditor(this)),
      m_breakModel(new PageBreakModel(this)),
      m_sync(new PageSynchronizer(this)),
      m_hRuler(new MarginRuler(Qt::Horizontal, this)),
      m_vRuler(new MarginRuler(Qt::Vertical, this)),
      m_paginationTimer(new QTimer(this))
{
    qDebug() << "[PageView] Constructor starting";
    m_surface = std::make_unique<TextEditContentSurface>(m_editor);

    // Editor inside the content box; the outer scroll area scrolls
    m_editor->setFrameStyle(QFrame::NoFrame);
    m_editor->setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    m_editor->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);

    QPalette pal = m_editor->palette();
    pal.setColor(QPalette::Base, Qt::transparent);
    m_editor->setPalette(pal);
    m_editor->setAutoFillBackground(false);
    m_editor->viewport()->setAutoFillBackground(false);

    m_paginationTimer->setSingleShot(true);
    m_paginationTimer->setInterval(DEBOUNCE_MS);
    connect(m_paginationTimer, &QTimer::timeout, this, &PageView::recomputePagination);

    connect(m_editor->document(), &QTextDocument::contentsChanged, this, &PageView::schedulePagination);
    connect(m_editor->document()->documentLayout(), &QAbstractTextDocumentLayout::documentSizeChanged,
            this, &PageView::schedulePagination);
    connect(m_editor, &QTextEdit::cursorPositionChanged, this, &PageView::onCursorMoved);

    connect(m_breakModel, &PageBreakModel::markersPruned, this, &PageView::onMarkersPruned);
    connect(m_sync, &PageSynchronizer::scrollRequested, this, &PageView::onScrollRequested);
    connect(m_sync, &PageSynchronizer::revealCaretRequested, this, &PageView::onRevealCaret);
    connect(m_sync, &PageSynchronizer::currentPageChanged, this, [this](int page) {
        update();
        emit currentPageChanged(page);
    });

    for (MarginRuler *ruler : {m_hRuler, m_vRuler}) {
        connect(ruler->controller(), &MarginRulerController::marginsChanged, this, &PageView::setMargins);
    }

    applyGeometry();
    qDebug() << "[PageView] Constructor complete, page count:" << pageCount();
}

PageView::~PageView()
{
    m_paginationTimer->stop();
}

int PageView::pageCount() const
{
    return m_breakModel->pageCount();
}

int PageView::currentPage() const
{
    return m_sync->currentPage();
}

QVector<qreal> PageView::breakPositions() const
{
    return m_breakModel->breakPositions();
}

QVector<PrintPage> PageView::printPages() const
{
    return PrintCompositor::slicePages(m_overflow.contentHeight, breakPositions(), m_content.marginTop);
}

QVector<Page> PageView::pages() const
{
    return m_breakModel->splitIntoPages(m_document, breakPositions(), m_content.marginTop);
}

QString PageView::pageLabel(int index) const
{
    return m_breakModel->pageLabel(index);
}

QRect PageView::sheetRect() const
{
    return QRect(sheetLeft(), SHEET_TOP,
                 static_cast<int>(std::ceil(m_content.width)),
                 static_cast<int>(std::ceil(sheetHeight())));
}

void PageView::setPageLayout(const PageGeometry::PageLayout &layout)
{
    m_layout = layout;
    applyGeometry();
    emit pageLayoutChanged(m_layout);
}

void PageView::setMargins(const PageGeometry::Margins &margins)
{
    if (margins == m_layout.margins) {
        return;
    }
    m_layout.margins = margins;
    applyGeometry();
    emit pageLayoutChanged(m_layout);
}

void PageView::setShowMarginGuides(bool show)
{
    if (m_layout.showMarginGuides == show) {
        return;
    }
    m_layout.showMarginGuides = show;
    update();
    emit pageLayoutChanged(m_layout);
}

void PageView::setZoom(double zoom)
{
    const double clamped = PageGeometry::clampZoom(zoom);
    if (qFuzzyCompare(clamped, m_zoom)) {
        return;
    }
    m_zoom = clamped;
    applyGeometry();
    emit zoomChanged(m_zoom);
}

void PageView::setRightToLeft(bool rtl)
{
    if (m_rtl == rtl) {
        return;
    }
    m_rtl = rtl;
    applyGeometry();
}

void PageView::zoomInView()
{
    setZoom(m_zoom * ZOOM_STEP_MULTIPLIER);
}

void PageView::zoomOutView()
{
    setZoom(m_zoom / ZOOM_STEP_MULTIPLIER);
}

void PageView::resetZoom()
{
    setZoom(PageGeometry::DEFAULT_ZOOM);
}

void PageView::applyGeometry()
{
    m_layout = PageGeometry::sanitizeLayout(m_layout);
    const PageGeometry::PageDimensions dims = PageGeometry::resolvePageDimensions(m_layout);
    if (dims.isValid()) {
        m_pageDims = dims;
    } else if (!m_pageDims.isValid()) {
        qWarning() << "[PageView] No usable page geometry, using A4 defaults";
        m_pageDims = PageGeometry::resolvePageDimensions(PageGeometry::PageSize::A4, 0, 0,
                                                         PageGeometry::Orientation::Portrait);
    } else {
        qWarning() << "[PageView] Invalid page geometry, keeping last known good";
    }
    m_content = PageGeometry::resolveContentDimensions(m_pageDims, m_layout.margins, m_zoom);

    m_editor->setRightToLeft(m_rtl);
    m_editor->setZoomFactor(m_zoom);
    for (MarginRuler *ruler : {m_hRuler, m_vRuler}) {
        ruler->setPageGeometry(m_pageDims.widthMm, m_pageDims.heightMm, m_zoom, m_rtl);
        ruler->setMargins(m_layout.margins);
    }

    layoutPages();

    // Geometry edits recompute immediately; any queued content pass is superseded
    m_paginationTimer->stop();
    recomputePagination();
}

void PageView::schedulePagination()
{
    if (m_recomputing) {
        return;
    }
    m_paginationTimer->start();
}

void PageView::recomputePagination()
{
    if (m_recomputing) {
        return;
    }
    if (!m_surface || !m_surface->isReady()) {
        qDebug() << "[PageView] Content surface not ready, skipping pagination pass";
        return;
    }
    m_recomputing = true;

    const QVector<qreal> previousBreaks = m_breakModel->breakPositions();
    const int previousCount = m_breakModel->pageCount();

    const qreal contentHeight = m_surface->contentHeight();
    m_document = m_surface->snapshot();
    m_overflow = Pagination::calculateOverflowInfo(contentHeight, m_content, blockExtentsOf(m_document));
    m_breakModel->reconcile(m_document, m_overflow, m_surface.get(), m_content.marginTop);
    syncMarkerPageNumbers();

    m_sync->setPagination(m_breakModel->breakPositions(), m_content.availableHeight(), m_content.marginTop);
    QScrollArea *sa = scrollArea();
    m_sync->setViewport(sa ? sa->viewport()->height() : height(), sheetHeight());

    layoutPages();
    update();
    m_recomputing = false;

    if (previousCount != m_breakModel->pageCount() || previousBreaks != m_breakModel->breakPositions()) {
        qDebug() << "[PageView] Pagination:" << m_breakModel->pageCount() << "pages, content" << contentHeight
                 << "px, available" << m_content.availableHeight() << "px";
    }
    emit paginationChanged(m_breakModel->pageCount());
}

void PageView::syncMarkerPageNumbers()
{
    for (const PageBreakMarker &marker : m_document.markers()) {
        m_editor->setMarkerPageNumber(marker.id, marker.pageNumber);
    }
}

void PageView::onMarkersPruned(const QStringList &markerIds)
{
    // Removal edits the document; run it outside the pagination pass
    QTimer::singleShot(0, this, [this, markerIds] {
        for (const QString &id : markerIds) {
            m_editor->removeManualPageBreak(id);
        }
    });
}

void PageView::insertPageBreak()
{
    m_editor->insertManualPageBreak();
    m_paginationTimer->stop();
    recomputePagination();
}

void PageView::goToPage(int pageIndex)
{
    m_sync->goToPage(pageIndex);
}

void PageView::nextPage()
{
    m_sync->nextPage();
}

void PageView::previousPage()
{
    m_sync->previousPage();
}

PdfExporter::Settings PageView::printSettings() const
{
    const PageGeometry::ContentPadding visual = PageGeometry::contentPadding(m_layout.margins, m_rtl);

    PdfExporter::Settings settings;
    settings.pageWidthMm = m_pageDims.widthMm;
    settings.pageHeightMm = m_pageDims.heightMm;
    settings.marginLeftMm = visual.left;
    settings.marginRightMm = visual.right;
    settings.marginTopMm = visual.top;
    settings.marginBottomMm = visual.bottom;
    settings.contentWidthPx = m_content.availableWidth();
    settings.availableHeightPx = m_content.availableHeight();
    return settings;
}

bool PageView::exportToPdf(const QString &filePath)
{
    m_paginationTimer->stop();
    recomputePagination();
    return PdfExporter::exportDocumentToPdf(m_editor->document(), filePath, printSettings(), printPages());
}

bool PageView::print(QPrinter *printer)
{
    m_paginationTimer->stop();
    recomputePagination();
    return PdfExporter::printDocument(m_editor->document(), printer, printSettings(), printPages());
}

int PageView::sheetLeft() const
{
    int x = (width() - static_cast<int>(m_content.width)) / 2;
    if (x < SHEET_SIDE) x = SHEET_SIDE;
    return x;
}

qreal PageView::sheetHeight() const
{
    const qreal avail = std::max<qreal>(0.0, m_content.availableHeight());
    const QVector<qreal> breaks = m_breakModel->breakPositions();
    const qreal lastPageStart = breaks.isEmpty() ? m_content.marginTop : breaks.last();
    return std::max({m_content.height,
                     lastPageStart + avail + m_content.marginBottom,
                     m_overflow.contentHeight + m_content.marginTop + m_content.marginBottom});
}

void PageView::layoutPages()
{
    const int x = sheetLeft();
    const int pageW = static_cast<int>(std::ceil(m_content.width));
    const int pageH = static_cast<int>(std::ceil(m_content.height));
    const qreal totalH = sheetHeight();

    const PageGeometry::ContentPadding padding = PageGeometry::contentPadding(m_layout.margins, m_rtl);
    const int editorLeft = x + static_cast<int>(PageGeometry::mmToPx(padding.left, m_zoom));
    const int editorTop = SHEET_TOP + static_cast<int>(m_content.marginTop);
    const int editorW = std::max(1, static_cast<int>(m_content.availableWidth()));
    const int editorH = std::max(1, static_cast<int>(std::ceil(totalH - m_content.marginTop - m_content.marginBottom)));

    m_editor->setGeometry(QRect(editorLeft, editorTop, editorW, editorH));
    m_editor->setLineWrapColumnOrWidth(editorW);

    const int rulerT = MarginRuler::RULER_THICKNESS;
    m_hRuler->setGeometry(x, SHEET_TOP - rulerT - RULER_GAP, pageW, rulerT);
    m_vRuler->setGeometry(x - rulerT - RULER_GAP, SHEET_TOP, rulerT, pageH);

    const int fixedWidth = pageW + 2 * SHEET_SIDE;
    const int fixedHeight = SHEET_TOP + static_cast<int>(std::ceil(totalH)) + PAGE_PADDING;
    setMinimumWidth(fixedWidth);
    setMaximumWidth(QWIDGETSIZE_MAX);
    setMinimumHeight(fixedHeight);
    setMaximumHeight(fixedHeight);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);
}

void PageView::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);
    QPainter p(this);
    p.fillRect(rect(), QColor(BG_GRAY_VALUE, BG_GRAY_VALUE, BG_GRAY_VALUE));

    const QRect sheet = sheetRect();
    p.fillRect(sheet, Qt::white);
    p.setPen(QPen(QColor(BORDER_GRAY_VALUE, BORDER_GRAY_VALUE, BORDER_GRAY_VALUE)));
    p.drawRect(sheet.adjusted(0, 0, -1, -1));

    const PageGeometry::ContentPadding padding = PageGeometry::contentPadding(m_layout.margins, m_rtl);
    const qreal contentLeft = sheet.left() + PageGeometry::mmToPx(padding.left, m_zoom);
    const qreal contentRight = sheet.left() + m_content.width - PageGeometry::mmToPx(padding.right, m_zoom);
    const QVector<qreal> breaks = m_breakModel->breakPositions();

    if (m_layout.showMarginGuides) {
        p.setPen(QPen(QColor(160, 190, 230), 1, Qt::DashLine));
        p.drawLine(QPointF(contentLeft, sheet.top()), QPointF(contentLeft, sheet.bottom()));
        p.drawLine(QPointF(contentRight, sheet.top()), QPointF(contentRight, sheet.bottom()));
        const qreal firstTop = sheet.top() + m_content.marginTop;
        p.drawLine(QPointF(sheet.left(), firstTop), QPointF(sheet.right(), firstTop));
        const qreal lastBottom = sheet.top() + sheetHeight() - m_content.marginBottom;
        p.drawLine(QPointF(sheet.left(), lastBottom), QPointF(sheet.right(), lastBottom));
    }

    // Page boundaries
    const QVector<qreal> &manual = m_breakModel->manualBreakPositions();
    QFont badgeFont = font();
    badgeFont.setPointSize(BADGE_FONT_SIZE);
    p.setFont(badgeFont);
    for (qreal position : breaks) {
        const qreal y = sheet.top() + position;
        const bool isManual = std::any_of(manual.cbegin(), manual.cend(), [position](qreal m) {
            return std::abs(m - position) < PageBreakModel::kDuplicateBreakTolerancePx;
        });
        p.setPen(QPen(isManual ? QColor(74, 144, 226) : QColor(200, 200, 200), 1, Qt::DashLine));
        p.drawLine(QPointF(sheet.left(), y), QPointF(sheet.right(), y));
        if (isManual) {
            p.setPen(QColor(74, 144, 226));
            p.drawText(QRectF(sheet.left(), y - BADGE_HEIGHT, sheet.width(), BADGE_HEIGHT),
                       Qt::AlignCenter, tr("Page break"));
        }
    }

    // Page badges on the outer corner
    const int current = m_sync->currentPage();
    for (int i = 0; i < pageCount(); ++i) {
        const qreal pageTop = sheet.top() + (i == 0 ? 0.0 : breaks.at(i - 1));
        const qreal badgeX = m_rtl ? sheet.left() + 4 : sheet.right() - BADGE_WIDTH - 4;
        const QRectF badge(badgeX, pageTop + 4, BADGE_WIDTH, BADGE_HEIGHT);
        p.setPen(i == current ? QColor(74, 144, 226) : QColor(150, 150, 150));
        p.drawText(badge, Qt::AlignCenter, pageLabel(i));
    }
}

void PageView::resizeEvent(QResizeEvent *event)
{
    Q_UNUSED(event);
    layoutPages();
}

void PageView::showEvent(QShowEvent *event)
{
    QWidget::showEvent(event);
    attachScrollArea();
}

QScrollArea *PageView::scrollArea() const
{
    QWidget *p = parentWidget();
    QScrollArea *sa = nullptr;
    while (p && !sa) {
        sa = qobject_cast<QScrollArea*>(p);
        p = p->parentWidget();
    }
    return sa;
}

void PageView::attachScrollArea()
{
    if (m_scrollAttached) {
        return;
    }
    QScrollArea *sa = scrollArea();
    if (!sa) {
        return;
    }
    connect(sa->verticalScrollBar(), &QScrollBar::valueChanged, this, &PageView::onScrolled);
    m_scrollAttached = true;
}

void PageView::onScrolled(int value)
{
    QScrollArea *sa = scrollArea();
    m_sync->setViewport(sa ? sa->viewport()->height() : height(), sheetHeight());
    m_sync->handleEvent({PageSynchronizer::Source::Scroll, static_cast<qreal>(value - SHEET_TOP)});
}

void PageView::onCursorMoved()
{
    const qreal caretTop = m_editor->cursorRect().top() + m_content.marginTop;
    m_sync->handleEvent({PageSynchronizer::Source::Cursor, caretTop});
}

void PageView::onRevealCaret()
{
    scrollToCursor();
    QTimer::singleShot(0, m_sync, &PageSynchronizer::notifyScrollEnded);
}

void PageView::onScrollRequested(qreal offset)
{
    QScrollArea *sa = scrollArea();
    if (!sa) {
        m_sync->notifyScrollEnded();
        return;
    }
    sa->verticalScrollBar()->setValue(SHEET_TOP + static_cast<int>(offset));
    QTimer::singleShot(0, m_sync, &PageSynchronizer::notifyScrollEnded);
}

void PageView::scrollToCursor()
{
    QScrollArea *sa = scrollArea();
    if (!sa) return;

    QRect cr = m_editor->cursorRect();
    QPoint center = m_editor->mapTo(this, cr.center());
    sa->ensureVisible(center.x(), center.y(), SCROLL_X_MARGIN, SCROLL_Y_MARGIN);
}
