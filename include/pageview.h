#pragma once
#include <QWidget>
#include <QRect>
#include <QScrollArea>
#include <memory>

#include "document.h"
#include "overflowcalculator.h"
#include "pagebreakmodel.h"
#include "pagegeometry.h"
#include "pdfexporter.h"
#include "printcompositor.h"

class RichTextEditor;
class IContentSurface;
class MarginRuler;
class PageSynchronizer;
class QPrinter;
class QTimer;

class PageView : public QWidget {
    Q_OBJECT
public:
    explicit PageView(QWidget *parent = nullptr);
    ~PageView() override;

    RichTextEditor* editor() const { return m_editor; }
    PageBreakModel* pageBreakModel() const { return m_breakModel; }
    PageSynchronizer* synchronizer() const { return m_sync; }
    MarginRuler* horizontalRuler() const { return m_hRuler; }
    MarginRuler* verticalRuler() const { return m_vRuler; }

    const PageGeometry::PageLayout &pageLayout() const { return m_layout; }
    const PageGeometry::PageDimensions &pageDimensions() const { return m_pageDims; }
    const PageGeometry::ContentDimensions &contentDimensions() const { return m_content; }
    const Pagination::OverflowInfo &overflowInfo() const { return m_overflow; }
    const Document &document() const { return m_document; }

    int pageCount() const;
    int currentPage() const;
    QVector<qreal> breakPositions() const;
    QVector<PrintPage> printPages() const;
    QVector<Page> pages() const;
    QString pageLabel(int index) const;

    double zoom() const { return m_zoom; }
    bool isRightToLeft() const { return m_rtl; }
    int sheetTop() const { return SHEET_TOP; }
    QRect sheetRect() const;

    void setPageLayout(const PageGeometry::PageLayout &layout);
    void setMargins(const PageGeometry::Margins &margins);
    void setShowMarginGuides(bool show);
    void setZoom(double zoom);
    void setRightToLeft(bool rtl);

    bool exportToPdf(const QString &filePath);
    bool print(QPrinter *printer);
    PdfExporter::Settings printSettings() const;

public slots:
    void recomputePagination();
    void schedulePagination();
    void insertPageBreak();
    void goToPage(int pageIndex);
    void nextPage();
    void previousPage();
    void zoomInView();
    void zoomOutView();
    void resetZoom();
    void scrollToCursor();

signals:
    void paginationChanged(int pageCount);
    void currentPageChanged(int page);
    void pageLayoutChanged(const PageGeometry::PageLayout &layout);
    void zoomChanged(double zoom);

protected:
    void paintEvent(QPaintEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;
    void showEvent(QShowEvent *event) override;

private:
    QScrollArea *scrollArea() const;
    void attachScrollArea();
    void applyGeometry();
    void layoutPages();
    void syncMarkerPageNumbers();
    void onScrolled(int value);
    void onCursorMoved();
    void onRevealCaret();
    void onScrollRequested(qreal offset);
    void onMarkersPruned(const QStringList &markerIds);
    int sheetLeft() const;
    qreal sheetHeight() const;

    // Display constants
    static constexpr int PAGE_PADDING = 20;
    static constexpr int RULER_GAP = 4;
    static constexpr int SHEET_TOP = PAGE_PADDING + 24 + RULER_GAP; // room for the horizontal ruler
    static constexpr int SHEET_SIDE = PAGE_PADDING + 24 + RULER_GAP;
    static constexpr int DEBOUNCE_MS = 150;
    static constexpr double ZOOM_STEP_MULTIPLIER = 1.1;

    // Background colors
    static constexpr int BG_GRAY_VALUE = 28;
    static constexpr int BORDER_GRAY_VALUE = 70;

    // Page badges
    static constexpr int BADGE_FONT_SIZE = 8;
    static constexpr int BADGE_WIDTH = 90;
    static constexpr int BADGE_HEIGHT = 18;

    // Scroll behavior
    static constexpr int SCROLL_X_MARGIN = 40;
    static constexpr int SCROLL_Y_MARGIN = 120;

    PageGeometry::PageLayout m_layout;
    PageGeometry::PageDimensions m_pageDims;  // last known good
    PageGeometry::ContentDimensions m_content;
    Pagination::OverflowInfo m_overflow;
    Document m_document;
    double m_zoom = PageGeometry::DEFAULT_ZOOM;
    bool m_rtl = true;

    bool m_recomputing = false;        // Guard against recursive passes
    bool m_scrollAttached = false;
    RichTextEditor* m_editor;
    std::unique_ptr<IContentSurface> m_surface;
    PageBreakModel* m_breakModel;
    PageSynchronizer* m_sync;
    MarginRuler* m_hRuler;
    MarginRuler* m_vRuler;
    QTimer* m_paginationTimer;
};
