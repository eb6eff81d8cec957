#include "document.h"

#include <QUuid>
#include <algorithm>

DocumentNode DocumentNode::paragraph(const QString &text)
{
    DocumentNode node;
    node.type = Paragraph;
    node.text = text;
    return node;
}

DocumentNode DocumentNode::heading(const QString &text, int level)
{
    DocumentNode node;
    node.type = Heading;
    node.text = text;
    node.level = qBound(1, level, 6);
    return node;
}

DocumentNode DocumentNode::listItem(const QString &text)
{
    DocumentNode node;
    node.type = ListItem;
    node.text = text;
    return node;
}

DocumentNode DocumentNode::blockquote(const QString &text, int depth)
{
    DocumentNode node;
    node.type = Blockquote;
    node.text = text;
    node.level = qMax(1, depth);
    return node;
}

DocumentNode DocumentNode::table(const QVector<QStringList> &rows)
{
    DocumentNode node;
    node.type = Table;
    for (const QStringList &cells : rows) {
        DocumentNode row;
        row.type = TableRow;
        row.cells = cells;
        node.children.append(row);
    }
    return node;
}

DocumentNode DocumentNode::image(const QString &source)
{
    DocumentNode node;
    node.type = Image;
    node.source = source;
    return node;
}

DocumentNode DocumentNode::horizontalRule()
{
    DocumentNode node;
    node.type = HorizontalRule;
    return node;
}

DocumentNode DocumentNode::pageBreak(const PageBreakMarker &marker)
{
    DocumentNode node;
    node.type = PageBreak;
    node.marker = marker;
    return node;
}

bool DocumentNode::isAtomic() const
{
    switch (type) {
    case Paragraph:
    case Heading:
    case ListItem:
    case Blockquote:
        return false;
    case Table:
    case TableRow:
    case Image:
    case HorizontalRule:
    case PageBreak:
        return true;
    }
    return true;
}

int DocumentNode::length() const
{
    if (span > 0) {
        return span;
    }

    switch (type) {
    case Paragraph:
    case Heading:
    case ListItem:
    case Blockquote:
        return text.length() + 1;
    case TableRow: {
        int total = 0;
        for (const QString &cell : cells) {
            total += cell.length() + 1;
        }
        return qMax(1, total);
    }
    case Table: {
        int total = 1; // frame boundary
        for (const DocumentNode &row : children) {
            total += row.length();
        }
        return total;
    }
    case Image:
        return 2; // object replacement character + separator
    case HorizontalRule:
    case PageBreak:
        return 1;
    }
    return 1;
}

QString DocumentNode::plainText() const
{
    switch (type) {
    case Paragraph:
    case Heading:
    case ListItem:
    case Blockquote:
        return text;
    case TableRow:
        return cells.join(QLatin1Char('\t'));
    case Table: {
        QStringList rows;
        for (const DocumentNode &row : children) {
            rows << row.plainText();
        }
        return rows.join(QLatin1Char('\n'));
    }
    case PageBreak:
        return text; // typed into the marker block
    case Image:
    case HorizontalRule:
        return QString();
    }
    return QString();
}

Document Document::fromPlainText(const QString &text)
{
    Document doc;
    const QStringList lines = text.split(QLatin1Char('\n'));
    for (const QString &line : lines) {
        doc.append(DocumentNode::paragraph(line));
    }
    return doc;
}

void Document::append(const DocumentNode &node)
{
    m_nodes.append(node);
    reindex();
}

void Document::insertNode(int index, const DocumentNode &node)
{
    m_nodes.insert(qBound(0, index, m_nodes.size()), node);
    reindex();
}

bool Document::removeNode(int index)
{
    if (index < 0 || index >= m_nodes.size()) {
        return false;
    }
    m_nodes.remove(index);
    reindex();
    return true;
}

int Document::removeRange(int from, int to)
{
    int removed = 0;
    for (int i = m_nodes.size() - 1; i >= 0; --i) {
        const DocumentNode &node = m_nodes.at(i);
        if (node.position >= from && node.position + node.length() <= to) {
            m_nodes.remove(i);
            ++removed;
        }
    }
    if (removed > 0) {
        reindex();
    }
    return removed;
}

void Document::clear()
{
    m_nodes.clear();
    m_length = 0;
}

int Document::nodeIndexAt(int offset) const
{
    for (int i = 0; i < m_nodes.size(); ++i) {
        const DocumentNode &node = m_nodes.at(i);
        if (offset >= node.position && offset < node.position + node.length()) {
            return i;
        }
    }
    return -1;
}

int Document::indexOfMarker(const QString &markerId) const
{
    for (int i = 0; i < m_nodes.size(); ++i) {
        if (m_nodes.at(i).isPageBreak() && m_nodes.at(i).marker.id == markerId) {
            return i;
        }
    }
    return -1;
}

QVector<PageBreakMarker> Document::markers() const
{
    QVector<PageBreakMarker> result;
    for (const DocumentNode &node : m_nodes) {
        if (node.isPageBreak()) {
            result.append(node.marker);
        }
    }
    return result;
}

QString Document::insertPageBreak(int offset, bool manual)
{
    PageBreakMarker marker;
    marker.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    marker.isManual = manual;

    const int clamped = qBound(0, offset, m_length);
    const int index = nodeIndexAt(clamped);

    if (index < 0) {
        m_nodes.append(DocumentNode::pageBreak(marker));
    } else {
        DocumentNode &node = m_nodes[index];
        const int inner = clamped - node.position;
        if (inner == 0) {
            m_nodes.insert(index, DocumentNode::pageBreak(marker));
        } else if (isSplittable(node) && inner < node.text.length()) {
            DocumentNode tail = node;
            tail.text = node.text.mid(inner);
            node.text = node.text.left(inner);
            node.span = 0;
            tail.span = 0;
            m_nodes.insert(index + 1, DocumentNode::pageBreak(marker));
            m_nodes.insert(index + 2, tail);
        } else {
            m_nodes.insert(index + 1, DocumentNode::pageBreak(marker));
        }
    }

    reindex();
    return marker.id;
}

bool Document::removePageBreak(const QString &markerId)
{
    const int index = indexOfMarker(markerId);
    if (index < 0) {
        return false;
    }
    return removeNode(index);
}

bool Document::setMarkerPageNumber(const QString &markerId, int pageNumber)
{
    const int index = indexOfMarker(markerId);
    if (index < 0) {
        return false;
    }
    m_nodes[index].marker.pageNumber = pageNumber;
    return true;
}

bool Document::isMarkerOrphaned(int nodeIndex) const
{
    if (nodeIndex < 0 || nodeIndex >= m_nodes.size() || !m_nodes.at(nodeIndex).isPageBreak()) {
        return false;
    }

    const DocumentNode &node = m_nodes.at(nodeIndex);
    if (node.marker.offset < 0 || node.marker.offset >= m_length) {
        return true;
    }
    if (!node.text.isEmpty()) {
        return false;
    }

    // Leading or consecutive markers are blank pages; only a marker with no
    // content left anywhere around it is dropped.
    return std::none_of(m_nodes.cbegin(), m_nodes.cend(), [](const DocumentNode &other) {
        return !other.isPageBreak() || !other.text.isEmpty();
    });
}

QString Document::plainText() const
{
    QStringList parts;
    for (const DocumentNode &node : m_nodes) {
        if (!node.isPageBreak() || !node.text.isEmpty()) {
            parts << node.plainText();
        }
    }
    return parts.join(QLatin1Char('\n'));
}

void Document::reindex()
{
    int position = 0;
    for (DocumentNode &node : m_nodes) {
        node.position = position;
        if (node.isPageBreak()) {
            node.marker.offset = position;
        }
        position += node.length();
    }
    m_length = position;
}

bool Document::isSplittable(const DocumentNode &node)
{
    return !node.isAtomic() && node.span == 0;
}
