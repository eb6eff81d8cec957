#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

struct PageBreakMarker {
    QString id;
    int pageNumber = 1;   // page this marker starts
    bool isManual = true;
    QString breakType = QStringLiteral("page");
    int offset = 0;       // document offset of the marker node
};

struct DocumentNode {
    enum Type {
        Paragraph,
        Heading,
        ListItem,
        Blockquote,
        Table,
        TableRow,
        Image,
        HorizontalRule,
        PageBreak
    };

    Type type = Paragraph;
    QString text;                   // Paragraph, Heading, ListItem, Blockquote; PageBreak once typed into
    int level = 0;                  // Heading level or quote depth
    QStringList cells;              // TableRow
    QVector<DocumentNode> children; // Table rows
    QString source;                 // Image
    PageBreakMarker marker;         // PageBreak

    // Set by Document::append / reindex.
    int position = 0;
    // Explicit offset span; 0 means derive it from the node's content.
    int span = 0;

    // Measured by the content surface, relative to the top of the flowed content.
    qreal top = 0.0;
    qreal height = 0.0;
    qreal lineHeight = 0.0;

    static DocumentNode paragraph(const QString &text);
    static DocumentNode heading(const QString &text, int level);
    static DocumentNode listItem(const QString &text);
    static DocumentNode blockquote(const QString &text, int depth = 1);
    static DocumentNode table(const QVector<QStringList> &rows);
    static DocumentNode image(const QString &source);
    static DocumentNode horizontalRule();
    static DocumentNode pageBreak(const PageBreakMarker &marker);

    bool isPageBreak() const { return type == PageBreak; }
    // Atomic nodes are never split across pages.
    bool isAtomic() const;
    int length() const;
    QString plainText() const;
    qreal bottom() const { return top + height; }
};

class Document {
public:
    Document() = default;

    static Document fromPlainText(const QString &text);

    const QVector<DocumentNode> &nodes() const { return m_nodes; }
    int nodeCount() const { return m_nodes.size(); }
    bool isEmpty() const { return m_nodes.isEmpty(); }
    int length() const { return m_length; }

    void append(const DocumentNode &node);
    void insertNode(int index, const DocumentNode &node);
    bool removeNode(int index);
    // Removes every node that lies entirely inside [from, to).
    int removeRange(int from, int to);
    void clear();

    int nodeIndexAt(int offset) const;
    int indexOfMarker(const QString &markerId) const;
    QVector<PageBreakMarker> markers() const;

    // Inserts a page-break node at the block boundary nearest to offset,
    // splitting a text node when offset falls inside it. Returns the marker id.
    QString insertPageBreak(int offset, bool manual = true);
    bool removePageBreak(const QString &markerId);
    // Rewrites the pageNumber attribute of an existing marker.
    bool setMarkerPageNumber(const QString &markerId, int pageNumber);

    // A marker is orphaned when its offset no longer lies inside the document
    // or when every content node around it has been removed.
    bool isMarkerOrphaned(int nodeIndex) const;

    QString plainText() const;

private:
    void reindex();
    static bool isSplittable(const DocumentNode &node);

    QVector<DocumentNode> m_nodes;
    int m_length = 0;
};
