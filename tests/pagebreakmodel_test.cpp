#include <QTest>
#include <QObject>
#include <QHash>
#include <QSignalSpy>
#include "contentsurface.h"
#include "document.h"
#include "pagebreakmodel.h"

// Surface whose line rects are looked up by document offset
class OffsetTableSurface : public IContentSurface {
public:
    QHash<int, QRectF> rects;
    mutable QList<int> queried;

    bool isReady() const override { return true; }
    qreal contentHeight() const override { return 0.0; }
    QVector<Pagination::BlockExtent> blockExtents() const override { return {}; }
    QRectF rectForOffset(int offset) const override {
        queried << offset;
        return rects.value(offset);
    }
    Document snapshot() const override { return Document(); }
};

class PageBreakModelTests : public QObject {
    Q_OBJECT

private:
    static DocumentNode measured(DocumentNode node, qreal top, qreal height) {
        node.top = top;
        node.height = height;
        node.lineHeight = 20.0;
        return node;
    }

    static DocumentNode marker(qreal top) {
        PageBreakMarker m;
        m.id = QString("marker-%1").arg(top);
        return measured(DocumentNode::pageBreak(m), top, 20.0);
    }

    static Pagination::OverflowInfo overflowFor(qreal contentHeight, qreal available) {
        PageGeometry::ContentDimensions c;
        c.height = available;
        return Pagination::calculateOverflowInfo(contentHeight, c);
    }

private slots:
    void documentOffsetsFollowBlocks() {
        const Document doc = Document::fromPlainText("abc\nde");
        QCOMPARE(doc.nodeCount(), 2);
        QCOMPARE(doc.nodes().at(0).position, 0);
        QCOMPARE(doc.nodes().at(1).position, 4);
        QCOMPARE(doc.length(), 7);
        QCOMPARE(doc.nodeIndexAt(5), 1);
        QCOMPARE(doc.nodeIndexAt(99), -1);
    }

    void insertPageBreakSplitsParagraph() {
        Document doc = Document::fromPlainText("hello world");
        PageBreakModel model;
        const QString id = model.insertPageBreak(doc, 5);

        QVERIFY(!id.isEmpty());
        QCOMPARE(doc.nodeCount(), 3);
        QCOMPARE(doc.nodes().at(0).text, QString("hello"));
        QVERIFY(doc.nodes().at(1).isPageBreak());
        QCOMPARE(doc.nodes().at(2).text, QString(" world"));
        QCOMPARE(doc.markers().size(), 1);
        QCOMPARE(doc.markers().first().offset, 6);
        QCOMPARE(doc.markers().first().breakType, QString("page"));
        QVERIFY(doc.markers().first().isManual);
        QCOMPARE(doc.plainText(), QString("hello\n world"));
    }

    void insertAtBlockStartDoesNotSplit() {
        Document doc = Document::fromPlainText("one\ntwo");
        doc.insertPageBreak(4);
        QCOMPARE(doc.nodeCount(), 3);
        QCOMPARE(doc.nodes().at(0).text, QString("one"));
        QVERIFY(doc.nodes().at(1).isPageBreak());
        QCOMPARE(doc.nodes().at(2).text, QString("two"));
    }

    void removePageBreakById() {
        Document doc = Document::fromPlainText("one\ntwo");
        PageBreakModel model;
        const QString id = model.insertPageBreak(doc, 4);
        QVERIFY(model.removePageBreak(doc, id));
        QCOMPARE(doc.nodeCount(), 2);
        QVERIFY(!model.removePageBreak(doc, id));
    }

    void orphanDetection() {
        Document doc;
        doc.append(marker(0));
        doc.append(DocumentNode::paragraph("a"));
        doc.append(marker(40));
        doc.append(marker(60));
        doc.append(DocumentNode::paragraph("b"));

        QVERIFY(!doc.isMarkerOrphaned(0));  // leading break: blank first page
        QVERIFY(!doc.isMarkerOrphaned(2));
        QVERIFY(!doc.isMarkerOrphaned(3));  // consecutive breaks: blank page between
        QVERIFY(!doc.isMarkerOrphaned(1));  // not a marker

        DocumentNode typedInto = marker(80);
        typedInto.text = QString("typed into the break");
        doc.insertNode(2, typedInto);
        QVERIFY(!doc.isMarkerOrphaned(2));

        Document bare;
        bare.append(marker(0));
        bare.append(marker(20));
        QVERIFY(bare.isMarkerOrphaned(0));
        QVERIFY(bare.isMarkerOrphaned(1));
    }

    void consecutiveBreaksLeaveBlankPages() {
        Document doc;
        doc.append(measured(DocumentNode::paragraph("text"), 0, 20));
        doc.append(marker(20));
        doc.append(marker(40));
        doc.append(marker(60));

        PageBreakModel model;
        QSignalSpy prunedSpy(&model, &PageBreakModel::markersPruned);
        model.reconcile(doc, overflowFor(80, 971), nullptr, 0.0);

        QCOMPARE(prunedSpy.count(), 0);
        QCOMPARE(doc.markers().size(), 3);
        QCOMPARE(model.breakPositions(), (QVector<qreal>{40.0, 60.0, 80.0}));
        QCOMPARE(model.pageCount(), 4);

        const QVector<Page> pages = model.splitIntoPages(doc, model.breakPositions());
        QCOMPARE(pages.size(), 4);
        QCOMPARE(pages.at(0).content.size(), 1);
        QVERIFY(pages.at(1).content.isEmpty());
        QVERIFY(pages.at(2).content.isEmpty());
        QCOMPARE(doc.markers().at(2).pageNumber, 4);
    }

    void leadingBreakIsKept() {
        Document doc;
        doc.append(marker(0));
        doc.append(measured(DocumentNode::paragraph("after"), 20, 20));

        PageBreakModel model;
        QSignalSpy prunedSpy(&model, &PageBreakModel::markersPruned);
        model.reconcile(doc, overflowFor(40, 971), nullptr, 0.0);

        QCOMPARE(prunedSpy.count(), 0);
        QCOMPARE(model.pageCount(), 2);
        const QVector<Page> pages = model.splitIntoPages(doc, model.breakPositions());
        QVERIFY(pages.at(0).content.isEmpty());
        QCOMPARE(pages.at(1).content.first().text, QString("after"));
    }

    void textTypedIntoBreakStaysAbove() {
        Document doc;
        doc.append(measured(DocumentNode::paragraph("before"), 0, 20));
        DocumentNode typedInto = marker(20);
        typedInto.text = QString("typed");
        doc.append(typedInto);
        doc.append(measured(DocumentNode::paragraph("after"), 40, 20));

        PageBreakModel model;
        model.reconcile(doc, overflowFor(60, 971), nullptr, 0.0);
        QCOMPARE(doc.markers().size(), 1);

        const QVector<Page> pages = model.splitIntoPages(doc, model.breakPositions());
        QCOMPARE(pages.size(), 2);
        QCOMPARE(pages.at(0).content.size(), 2);
        QCOMPARE(pages.at(0).content.at(1).plainText(), QString("typed"));
        QCOMPARE(doc.plainText(), QString("before\ntyped\nafter"));
    }

    void manualBreakStartsNewPage() {
        Document doc;
        doc.append(measured(DocumentNode::paragraph("before"), 0, 20));
        doc.append(marker(20));
        doc.append(measured(DocumentNode::paragraph("after"), 40, 20));

        PageBreakModel model;
        QCOMPARE(model.state(), PageBreakModel::State::Unpaginated);
        QSignalSpy stateSpy(&model, &PageBreakModel::stateChanged);

        model.reconcile(doc, overflowFor(60, 971), nullptr, 50.0);

        QCOMPARE(model.state(), PageBreakModel::State::MultiPage);
        QCOMPARE(stateSpy.count(), 1);
        QCOMPARE(model.pageCount(), 2);
        QCOMPARE(model.breakPositions().size(), 1);
        QCOMPARE(model.breakPositions().at(0), 90.0);
        QCOMPARE(model.manualBreakPositions().size(), 1);
        QCOMPARE(doc.markers().first().pageNumber, 2);
    }

    void markerWithoutSurroundingContentIsDropped() {
        Document doc;
        doc.append(measured(DocumentNode::paragraph("before"), 0, 20));
        doc.append(marker(20));
        doc.append(measured(DocumentNode::paragraph("after"), 40, 20));

        PageBreakModel model;
        model.reconcile(doc, overflowFor(60, 971), nullptr, 0.0);
        QCOMPARE(model.pageCount(), 2);
        const QString id = doc.markers().first().id;

        // Delete everything around the marker
        QCOMPARE(doc.removeRange(0, 7), 1);
        doc.removeNode(doc.nodeCount() - 1);
        QCOMPARE(doc.nodeCount(), 1);

        QSignalSpy prunedSpy(&model, &PageBreakModel::markersPruned);
        model.reconcile(doc, overflowFor(20, 971), nullptr, 0.0);

        QCOMPARE(prunedSpy.count(), 1);
        QCOMPARE(prunedSpy.at(0).at(0).toStringList(), QStringList{id});
        QVERIFY(doc.markers().isEmpty());
        QCOMPARE(model.pageCount(), 1);
        QCOMPARE(model.state(), PageBreakModel::State::SinglePage);

        // Page count now comes from overflow alone
        model.reconcile(doc, overflowFor(2500, 1000), nullptr, 0.0);
        QCOMPARE(model.pageCount(), 3);
        QCOMPARE(model.state(), PageBreakModel::State::MultiPage);
    }

    void markerPositionsComeFromSurfaceOffsets() {
        Document doc = Document::fromPlainText("a\nb\nc");
        doc.insertPageBreak(2);
        doc.insertPageBreak(5);
        QCOMPARE(doc.markers().at(0).offset, 2);
        QCOMPARE(doc.markers().at(1).offset, 5);

        OffsetTableSurface surface;
        surface.rects.insert(2, QRectF(0, 20, 100, 20));
        surface.rects.insert(5, QRectF(0, 60, 100, 20));

        PageBreakModel model;
        model.reconcile(doc, overflowFor(100, 971), &surface, 10.0);
        QCOMPARE(surface.queried, (QList<int>{2, 5}));
        QCOMPARE(model.manualBreakPositions(), (QVector<qreal>{50.0, 90.0}));
        QCOMPARE(model.getPageBreakPositions(doc, surface, 10.0), (QVector<qreal>{50.0, 90.0}));

        // Pruning happens after every marker has been resolved
        Document bare;
        bare.insertPageBreak(0);
        bare.insertPageBreak(1);
        surface.queried.clear();
        QSignalSpy prunedSpy(&model, &PageBreakModel::markersPruned);
        model.reconcile(bare, overflowFor(100, 971), &surface, 10.0);
        QCOMPARE(surface.queried, (QList<int>{0, 1}));
        QCOMPARE(prunedSpy.count(), 1);
        QCOMPARE(prunedSpy.at(0).at(0).toStringList().size(), 2);
        QVERIFY(model.manualBreakPositions().isEmpty());
        QCOMPARE(model.pageCount(), 1);
    }

    void duplicateBreaksCountOnce() {
        const QVector<qreal> merged = PageBreakModel::mergeBreakPositions({500.0}, {500.4, 1000.0});
        QCOMPARE(merged.size(), 2);
        QCOMPARE(merged.at(0), 500.0);
        QCOMPARE(merged.at(1), 1000.0);

        const QVector<qreal> distinct = PageBreakModel::mergeBreakPositions({700.0}, {500.0});
        QCOMPARE(distinct, (QVector<qreal>{500.0, 700.0}));
    }

    void markersAreRenumberedAfterAutomaticBreaks() {
        Document doc;
        doc.append(measured(DocumentNode::paragraph("long"), 0, 1500));
        doc.append(marker(1500));
        doc.append(measured(DocumentNode::paragraph("middle"), 1520, 100));
        doc.append(marker(1620));
        doc.append(measured(DocumentNode::paragraph("end"), 1640, 20));

        PageBreakModel model;
        model.reconcile(doc, overflowFor(1660, 1000), nullptr, 0.0);

        QCOMPARE(model.breakPositions(), (QVector<qreal>{1000.0, 1520.0, 1640.0}));
        QCOMPARE(model.pageCount(), 4);
        const QVector<PageBreakMarker> markers = doc.markers();
        QCOMPARE(markers.size(), 2);
        QCOMPARE(markers.at(0).pageNumber, 3);
        QCOMPARE(markers.at(1).pageNumber, 4);
    }

    void splitIntoPagesAtManualAndAutomaticBreaks() {
        Document doc;
        doc.append(measured(DocumentNode::paragraph("first"), 0, 20));
        doc.append(marker(20));
        doc.append(measured(DocumentNode::paragraph("second"), 40, 20));
        doc.append(measured(DocumentNode::paragraph("third"), 600, 20));

        PageBreakModel model;
        const QVector<Page> pages = model.splitIntoPages(doc, {40.0, 500.0});
        QCOMPARE(pages.size(), 3);
        QCOMPARE(pages.at(0).id, QString("page-1"));
        QCOMPARE(pages.at(0).content.size(), 1);
        QCOMPARE(pages.at(0).content.first().text, QString("first"));
        QCOMPARE(pages.at(1).content.first().text, QString("second"));
        QCOMPARE(pages.at(2).index, 2);
        QCOMPARE(pages.at(2).content.first().text, QString("third"));
    }

    void resetReturnsToUnpaginated() {
        Document doc = Document::fromPlainText("text");
        PageBreakModel model;
        model.reconcile(doc, overflowFor(3000, 1000), nullptr, 0.0);
        QCOMPARE(model.pageLabel(0), QString("Page 1 of 3"));

        QSignalSpy breaksSpy(&model, &PageBreakModel::breakPositionsChanged);
        model.reset();
        QCOMPARE(model.state(), PageBreakModel::State::Unpaginated);
        QCOMPARE(model.pageCount(), 1);
        QCOMPARE(breaksSpy.count(), 1);
    }
};

QTEST_MAIN(PageBreakModelTests)
#include "pagebreakmodel_test.moc"
