#include "contentsurface.h"

#include <QAbstractTextDocumentLayout>
#include <QDebug>
#include <QTextBlock>
#include <QTextDocument>
#include <QTextEdit>
#include <QTextFrame>
#include <QTextLayout>
#include <QTextList>
#include <QTextTable>
#include <cmath>

namespace {

struct SurfaceItem {
    int start = 0;
    QTextBlock block;
    QTextTable *table = nullptr;
};

qreal lineHeightOf(const QTextBlock &block, qreal blockHeight)
{
    const QTextLayout *layout = block.layout();
    const int lines = layout ? layout->lineCount() : 0;
    if (lines <= 0) {
        return blockHeight;
    }
    return blockHeight / lines;
}

} // namespace

TextEditContentSurface::TextEditContentSurface(QTextEdit *edit)
    : m_edit(edit)
{
}

bool TextEditContentSurface::isReady() const
{
    return m_edit && m_edit->document() && m_edit->document()->documentLayout();
}

qreal TextEditContentSurface::contentHeight() const
{
    if (!isReady()) {
        return 0.0;
    }
    const qreal height = m_edit->document()->documentLayout()->documentSize().height();
    return Pagination::sanitizeHeight(height);
}

QVector<Pagination::BlockExtent> TextEditContentSurface::blockExtents() const
{
    if (!isReady()) {
        return {};
    }
    return blockExtentsOf(snapshot());
}

QRectF TextEditContentSurface::rectForOffset(int offset) const
{
    if (!isReady()) {
        return QRectF();
    }
    QTextDocument *doc = m_edit->document();
    const QTextBlock block = doc->findBlock(qBound(0, offset, doc->characterCount() - 1));
    if (!block.isValid()) {
        return QRectF();
    }

    const QRectF blockRect = doc->documentLayout()->blockBoundingRect(block);
    const QTextLayout *layout = block.layout();
    if (!layout) {
        return blockRect;
    }
    const QTextLine line = layout->lineForTextPosition(offset - block.position());
    if (!line.isValid()) {
        return blockRect;
    }
    return QRectF(blockRect.left() + line.x(), blockRect.top() + line.y(), line.width(), line.height());
}

Document TextEditContentSurface::snapshot() const
{
    Document result;
    if (!isReady()) {
        qDebug() << "[ContentSurface] Snapshot requested before the editor is ready";
        return result;
    }

    QTextDocument *doc = m_edit->document();
    QVector<SurfaceItem> items;
    QTextFrame *root = doc->rootFrame();
    for (QTextFrame::iterator it = root->begin(); !it.atEnd(); ++it) {
        SurfaceItem item;
        if (QTextFrame *child = it.currentFrame()) {
            item.table = qobject_cast<QTextTable *>(child);
            if (!item.table) {
                continue;
            }
            item.start = child->firstPosition() - 1;
        } else {
            item.block = it.currentBlock();
            item.start = item.block.position();
        }
        items.append(item);
    }

    const int end = doc->characterCount();
    for (int i = 0; i < items.size(); ++i) {
        const SurfaceItem &item = items.at(i);
        DocumentNode node = item.table ? nodeForTable(item.table) : nodeForBlock(item.block);
        const int nextStart = i + 1 < items.size() ? items.at(i + 1).start : end;
        node.span = qMax(1, nextStart - item.start);
        result.append(node);
    }
    return result;
}

bool TextEditContentSurface::isMarkerBlock(const QTextBlock &block)
{
    return block.isValid() && !block.blockFormat().stringProperty(MarkerIdProperty).isEmpty();
}

DocumentNode TextEditContentSurface::nodeForBlock(const QTextBlock &block) const
{
    const QTextBlockFormat fmt = block.blockFormat();
    DocumentNode node;

    if (isMarkerBlock(block)) {
        PageBreakMarker marker;
        marker.id = fmt.stringProperty(MarkerIdProperty);
        if (const auto *data = dynamic_cast<const PageBreakBlockData *>(block.userData())) {
            marker.pageNumber = qMax(1, data->pageNumber);
        }
        marker.isManual = !fmt.hasProperty(MarkerManualProperty) || fmt.boolProperty(MarkerManualProperty);
        node = DocumentNode::pageBreak(marker);
        // Text typed into or merged with the marker block stays on the page above the break
        node.text = block.text();
    } else if (fmt.hasProperty(QTextFormat::BlockTrailingHorizontalRulerWidth)) {
        node = DocumentNode::horizontalRule();
    } else if (block.text() == QString(QChar::ObjectReplacementCharacter)
               && block.charFormat().isImageFormat()) {
        node = DocumentNode::image(block.charFormat().toImageFormat().name());
    } else if (fmt.headingLevel() > 0) {
        node = DocumentNode::heading(block.text(), fmt.headingLevel());
    } else if (block.textList()) {
        node = DocumentNode::listItem(block.text());
    } else if (fmt.intProperty(QTextFormat::BlockQuoteLevel) > 0) {
        node = DocumentNode::blockquote(block.text(), fmt.intProperty(QTextFormat::BlockQuoteLevel));
    } else {
        node = DocumentNode::paragraph(block.text());
    }

    const QRectF rect = m_edit->document()->documentLayout()->blockBoundingRect(block);
    node.top = rect.top();
    node.height = Pagination::sanitizeHeight(rect.height());
    node.lineHeight = lineHeightOf(block, node.height);
    return node;
}

DocumentNode TextEditContentSurface::nodeForTable(QTextTable *table) const
{
    QAbstractTextDocumentLayout *layout = m_edit->document()->documentLayout();
    DocumentNode node;
    node.type = DocumentNode::Table;

    for (int r = 0; r < table->rows(); ++r) {
        DocumentNode row;
        row.type = DocumentNode::TableRow;
        QRectF rowRect;
        for (int c = 0; c < table->columns(); ++c) {
            const QTextTableCell cell = table->cellAt(r, c);
            if (!cell.isValid()) {
                continue;
            }
            const QTextBlock first = cell.firstCursorPosition().block();
            row.cells << first.text();
            rowRect = rowRect.united(layout->blockBoundingRect(first));
        }
        row.top = rowRect.top();
        row.height = Pagination::sanitizeHeight(rowRect.height());
        row.lineHeight = row.height;
        node.children.append(row);
    }

    const QRectF frameRect = layout->frameBoundingRect(table);
    node.top = frameRect.top();
    node.height = Pagination::sanitizeHeight(frameRect.height());
    node.lineHeight = node.height;
    return node;
}

QVector<Pagination::BlockExtent> blockExtentsOf(const Document &document)
{
    QVector<Pagination::BlockExtent> extents;
    for (const DocumentNode &node : document.nodes()) {
        if (node.type == DocumentNode::Table && !node.children.isEmpty()) {
            for (const DocumentNode &row : node.children) {
                Pagination::BlockExtent extent;
                extent.top = row.top;
                extent.height = row.height;
                extent.lineHeight = row.lineHeight;
                extent.kind = Pagination::BlockExtent::AtomicBlock;
                extents.append(extent);
            }
            continue;
        }

        Pagination::BlockExtent extent;
        extent.top = node.top;
        extent.height = node.height;
        extent.lineHeight = node.lineHeight;
        extent.kind = node.isAtomic() ? Pagination::BlockExtent::AtomicBlock
                                      : Pagination::BlockExtent::TextBlock;
        extents.append(extent);
    }
    return extents;
}
