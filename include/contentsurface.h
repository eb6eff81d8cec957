#pragma once

#include <QPointer>
#include <QRectF>
#include <QTextBlockUserData>
#include <QTextFormat>
#include <QVector>

#include "document.h"
#include "overflowcalculator.h"

class QTextBlock;
class QTextEdit;
class QTextTable;

// Derived state of a manual page-break block. Kept out of the block format
// so that renumbering never enters the document's undo history.
class PageBreakBlockData : public QTextBlockUserData {
public:
    explicit PageBreakBlockData(int pageNumber) : pageNumber(pageNumber) {}
    int pageNumber;
};

// Measurable rendered content the pagination engine runs against.
// Coordinates are relative to the top of the flowed content.
class IContentSurface {
public:
    virtual ~IContentSurface() = default;
    virtual bool isReady() const = 0;
    virtual qreal contentHeight() const = 0;
    virtual QVector<Pagination::BlockExtent> blockExtents() const = 0;
    virtual QRectF rectForOffset(int offset) const = 0;
    virtual Document snapshot() const = 0;
};

class TextEditContentSurface final : public IContentSurface {
public:
    // Block properties carried by manual page-break blocks
    static constexpr int MarkerIdProperty = QTextFormat::UserProperty + 10;
    static constexpr int MarkerManualProperty = QTextFormat::UserProperty + 12;

    explicit TextEditContentSurface(QTextEdit *edit);

    bool isReady() const override;
    qreal contentHeight() const override;
    QVector<Pagination::BlockExtent> blockExtents() const override;
    QRectF rectForOffset(int offset) const override;
    Document snapshot() const override;

    static bool isMarkerBlock(const QTextBlock &block);

private:
    DocumentNode nodeForBlock(const QTextBlock &block) const;
    DocumentNode nodeForTable(QTextTable *table) const;

    QPointer<QTextEdit> m_edit;
};

// Flattens measured document nodes into extents; table rows become
// separate atomic extents.
QVector<Pagination::BlockExtent> blockExtentsOf(const Document &document);
