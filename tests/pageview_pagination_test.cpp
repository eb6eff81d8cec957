#include <QTest>
#include <QObject>
#include <QCoreApplication>
#include <QFile>
#include <QPrinter>
#include <QScrollArea>
#include <QScrollBar>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTextCursor>
#include <QTextDocument>
#include <QTextBlock>
#include <cmath>
#include "pageview.h"
#include "richtexteditor.h"
#include "contentsurface.h"
#include "marginruler.h"
#include "pagesynchronizer.h"
#include "paginationbar.h"
#include "pagenavigatorpanel.h"
#include "pagesetuppanel.h"

class PageViewPaginationTests : public QObject {
    Q_OBJECT

private:
    void insertLines(RichTextEditor* editor, int count, const QString &prefix = "سطر") {
        QTextCursor cur(editor->document());
        cur.movePosition(QTextCursor::End);
        for (int i = 0; i < count; ++i) {
            cur.insertText(QString("%1 %2").arg(prefix).arg(i));
            if (i < count - 1) cur.insertText("\n");
        }
        editor->setTextCursor(cur);
    }

    void typeAtEnd(RichTextEditor* editor, const QString &text) {
        QTextCursor cur = editor->textCursor();
        cur.movePosition(QTextCursor::End);
        cur.insertText(text);
        editor->setTextCursor(cur);
    }

private slots:
    void smallContentIsOnePage() {
        PageView pv;
        insertLines(pv.editor(), 10);
        pv.recomputePagination();

        QCOMPARE(pv.pageCount(), 1);
        QVERIFY(pv.breakPositions().isEmpty());
        QCOMPARE(pv.pageBreakModel()->state(), PageBreakModel::State::SinglePage);
        QVERIFY(!pv.overflowInfo().isOverflowing);
    }

    void longContentSpansSeveralPages() {
        PageView pv;
        insertLines(pv.editor(), 400);
        pv.recomputePagination();

        const Pagination::OverflowInfo &info = pv.overflowInfo();
        QVERIFY2(pv.pageCount() > 1, "Expected overflow into a second page");
        QCOMPARE(pv.pageCount(), info.pageCount);
        QCOMPARE(info.pageCount, static_cast<int>(std::ceil(info.contentHeight / info.availableHeight)));

        const QVector<qreal> breaks = pv.breakPositions();
        for (int i = 1; i < breaks.size(); ++i) {
            QVERIFY(breaks.at(i) > breaks.at(i - 1));
        }

        const QVector<PrintPage> slices = pv.printPages();
        QCOMPARE(slices.size(), pv.pageCount());
        for (const PrintPage &slice : slices) {
            QVERIFY(slice.height <= info.availableHeight + 1.0);
        }
        QCOMPARE(pv.pages().size(), pv.pageCount());
    }

    void contentEditsAreDebounced() {
        PageView pv;
        QSignalSpy spy(&pv, &PageView::paginationChanged);
        insertLines(pv.editor(), 400);
        QCOMPARE(spy.count(), 0);
        QCOMPARE(pv.pageCount(), 1);

        QTRY_VERIFY(spy.count() >= 1);
        QVERIFY(pv.pageCount() > 1);
    }

    void manualBreakStartsNewPage() {
        PageView pv;
        typeAtEnd(pv.editor(), "first");
        const QString id = pv.editor()->insertManualPageBreak();
        typeAtEnd(pv.editor(), "second");
        pv.recomputePagination();

        QVERIFY(!id.isEmpty());
        QCOMPARE(pv.editor()->manualPageBreakIds(), QStringList{id});
        QCOMPARE(pv.pageCount(), 2);
        QCOMPARE(pv.pageBreakModel()->manualBreakPositions().size(), 1);
        QCOMPARE(pv.pageBreakModel()->state(), PageBreakModel::State::MultiPage);

        const QVector<Page> pages = pv.pages();
        QCOMPARE(pages.size(), 2);
        QCOMPARE(pages.at(1).content.first().text, QString("second"));

        // The marker block carries the page it starts
        QCOMPARE(pv.editor()->markerPageNumber(id), 2);
    }

    void pageBreakInsertionCanBeUndone() {
        PageView pv;
        typeAtEnd(pv.editor(), "first");
        pv.recomputePagination();
        pv.editor()->insertManualPageBreak();
        pv.recomputePagination();
        QCOMPARE(pv.pageCount(), 2);

        // Renumbering the marker leaves the undo history alone
        QTextDocument *doc = pv.editor()->document();
        QVERIFY(doc->isUndoAvailable());
        pv.recomputePagination();
        QVERIFY(doc->isUndoAvailable());

        doc->undo();
        QVERIFY(pv.editor()->manualPageBreakIds().isEmpty());
        QVERIFY(doc->isUndoAvailable());
        pv.recomputePagination();
        QCOMPARE(pv.pageCount(), 1);
        QVERIFY(doc->isRedoAvailable());
    }

    void breakAtDocumentStartIsKept() {
        PageView pv;
        const QString id = pv.editor()->insertManualPageBreak();
        typeAtEnd(pv.editor(), "body");

        pv.recomputePagination();
        QCoreApplication::processEvents();
        QCOMPARE(pv.editor()->manualPageBreakIds(), QStringList{id});
        QCOMPARE(pv.pageCount(), 2);
        QVERIFY(pv.pages().at(0).content.isEmpty());
        QCOMPARE(pv.pages().at(1).content.first().text, QString("body"));
    }

    void twoBreaksInARowLeaveABlankPage() {
        PageView pv;
        typeAtEnd(pv.editor(), "abc");
        const QString first = pv.editor()->insertManualPageBreak();
        const QString second = pv.editor()->insertManualPageBreak();
        typeAtEnd(pv.editor(), "next");

        QTest::qWait(300);
        pv.recomputePagination();
        QCoreApplication::processEvents();

        QCOMPARE(pv.editor()->manualPageBreakIds(), (QStringList{first, second}));
        QCOMPARE(pv.pageCount(), 3);
        const QVector<Page> pages = pv.pages();
        QCOMPARE(pages.size(), 3);
        QCOMPARE(pages.at(0).content.first().text, QString("abc"));
        QVERIFY(pages.at(1).content.isEmpty());
        QCOMPARE(pages.at(2).content.first().text, QString("next"));
        QCOMPARE(pv.editor()->markerPageNumber(second), 3);
    }

    void removingTextAfterBreakDropsIt() {
        PageView pv;
        typeAtEnd(pv.editor(), "first");
        pv.editor()->insertManualPageBreak();
        typeAtEnd(pv.editor(), "second");
        pv.recomputePagination();
        QCOMPARE(pv.pageCount(), 2);

        // Delete everything from the marker block to the end of the document
        QTextDocument *doc = pv.editor()->document();
        QTextBlock markerBlock;
        for (QTextBlock b = doc->begin(); b.isValid(); b = b.next()) {
            if (TextEditContentSurface::isMarkerBlock(b)) {
                markerBlock = b;
            }
        }
        QVERIFY(markerBlock.isValid());
        QTextCursor cur(doc);
        cur.setPosition(markerBlock.position());
        cur.movePosition(QTextCursor::End, QTextCursor::KeepAnchor);
        cur.removeSelectedText();

        pv.recomputePagination();
        QCOMPARE(pv.pageCount(), 1);
        QTRY_VERIFY(pv.editor()->manualPageBreakIds().isEmpty());
        QCOMPARE(doc->toPlainText(), QString("first"));
    }

    void geometryChangesRecomputeImmediately() {
        PageView pv;
        insertLines(pv.editor(), 400);
        pv.recomputePagination();
        const int before = pv.pageCount();
        const qreal availableBefore = pv.overflowInfo().availableHeight;

        PageGeometry::Margins margins = pv.pageLayout().margins;
        margins.top = 50.0;
        margins.bottom = 50.0;
        pv.setMargins(margins);

        QVERIFY(pv.overflowInfo().availableHeight < availableBefore);
        QVERIFY(pv.pageCount() >= before);

        PageGeometry::PageLayout layout = pv.pageLayout();
        layout.orientation = PageGeometry::Orientation::Landscape;
        pv.setPageLayout(layout);
        QVERIFY(pv.contentDimensions().width > pv.contentDimensions().height);
        QVERIFY(pv.pageCount() > before);
    }

    void zoomIsClampedAndScalesPage() {
        PageView pv;
        const double width = pv.contentDimensions().width;
        pv.setZoom(2.0);
        QCOMPARE(pv.zoom(), 2.0);
        QVERIFY(std::abs(pv.contentDimensions().width - 2.0 * width) < 1e-6);

        pv.setZoom(10.0);
        QCOMPARE(pv.zoom(), PageGeometry::MAX_ZOOM);
        pv.resetZoom();
        QCOMPARE(pv.zoom(), 1.0);
    }

    void rulerDragUpdatesRightMarginInRtl() {
        PageView pv;
        QVERIFY(pv.isRightToLeft());
        const double before = pv.pageLayout().margins.right;

        MarginRulerController *controller = pv.horizontalRuler()->controller();
        QVERIFY(controller->pointerDown(MarginRulerController::Handle::Left, QPointF(0, 0)));
        controller->pointerUp(QPointF(10, 0));

        QVERIFY(std::abs(pv.pageLayout().margins.right - (before + 10.0 / PageGeometry::MM_TO_PX)) < 1e-6);
        QCOMPARE(pv.pageLayout().margins.left, PageGeometry::DEFAULT_MARGIN_MM);
    }

    void navigationMovesCurrentPage() {
        PageView pv;
        insertLines(pv.editor(), 400);
        pv.recomputePagination();
        QVERIFY(pv.pageCount() > 2);

        QSignalSpy spy(&pv, &PageView::currentPageChanged);
        pv.goToPage(2);
        QCOMPARE(pv.currentPage(), 2);
        QCOMPARE(spy.count(), 1);
        pv.previousPage();
        QCOMPARE(pv.currentPage(), 1);
        pv.goToPage(999);
        QCOMPARE(pv.currentPage(), pv.pageCount() - 1);
    }

    void paginationBarShowsStatus() {
        PaginationBar bar;
        bar.setPageStatus(1, 3);
        QCOMPARE(bar.statusText(), QString("Page 2 of 3"));
        bar.setPageStatus(7, 3);
        QCOMPARE(bar.statusText(), QString("Page 3 of 3"));
    }

    void navigatorListsPages() {
        PageView pv;
        typeAtEnd(pv.editor(), "first");
        pv.editor()->insertManualPageBreak();
        typeAtEnd(pv.editor(), "second");

        PageNavigatorPanel navigator;
        navigator.setPageView(&pv);
        pv.recomputePagination();

        QCOMPARE(navigator.entryCount(), 2);
        QCOMPARE(navigator.entryText(0), QString("1. first"));
        QCOMPARE(navigator.entryText(1), QString("2. second"));
    }

    void setupPanelShowsMarginsInChosenUnit() {
        PageView pv;
        PageSetupPanel panel;
        panel.setPageView(&pv);
        QCOMPARE(panel.marginText("top"), QString("20"));

        panel.setUnit(PageGeometry::MarginUnit::Inches);
        QCOMPARE(panel.marginText("top"), QString("0.787"));
        // Switching units never rewrites the stored millimeters
        QCOMPARE(pv.pageLayout().margins.top, PageGeometry::DEFAULT_MARGIN_MM);
    }

    void caretMovesRevealOnceAndSettle() {
        QScrollArea area;
        area.setWidgetResizable(true);
        auto *pv = new PageView;
        area.setWidget(pv);
        area.resize(900, 600);
        area.show();
        QVERIFY(QTest::qWaitForWindowExposed(&area));

        insertLines(pv->editor(), 400);
        pv->recomputePagination();
        QVERIFY(pv->pageCount() > 2);
        QTRY_VERIFY(!pv->synchronizer()->isScrollGuardActive());

        QSignalSpy revealSpy(pv->synchronizer(), &PageSynchronizer::revealCaretRequested);
        QTextCursor cur = pv->editor()->textCursor();
        cur.movePosition(QTextCursor::Start);
        pv->editor()->setTextCursor(cur);
        QCOMPARE(revealSpy.count(), 1);
        QCOMPARE(pv->currentPage(), 0);
        QTRY_VERIFY(!pv->synchronizer()->isScrollGuardActive());

        cur.movePosition(QTextCursor::End);
        pv->editor()->setTextCursor(cur);
        QCOMPARE(revealSpy.count(), 2);
        QCOMPARE(pv->currentPage(), pv->pageCount() - 1);
        QVERIFY(area.verticalScrollBar()->value() > 0);

        // The reveal scroll is released on the next event-loop turn, well before the settle timeout
        QTRY_VERIFY_WITH_TIMEOUT(!pv->synchronizer()->isScrollGuardActive(), PageSynchronizer::SCROLL_SETTLE_MS / 2);
        QCOMPARE(pv->currentPage(), pv->pageCount() - 1);
    }

    void printUsesPrinterOutput() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        PageView pv;
        insertLines(pv.editor(), 120);

        QPrinter printer(QPrinter::HighResolution);
        printer.setOutputFormat(QPrinter::PdfFormat);
        printer.setOutputFileName(dir.path() + "/printed.pdf");
        QVERIFY(pv.print(&printer));
        QVERIFY(QFile::exists(printer.outputFileName()));
    }

    void exportProducesPdf() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        PageView pv;
        insertLines(pv.editor(), 120);
        const QString path = dir.path() + "/document.pdf";
        QVERIFY(pv.exportToPdf(path));
        QVERIFY(QFile::exists(path));
    }
};

QTEST_MAIN(PageViewPaginationTests)
#include "pageview_pagination_test.moc"
