#include "richtexteditor.h"
#include "contentsurface.h"

#include <QDebug>
#include <QFontDatabase>
#include <QKeyEvent>
#include <QTextBlock>
#include <QTextBlockFormat>
#include <QTextCursor>
#include <QTextDocument>
#include <QTextOption>
#include <QUuid>

RichTextEditor::RichTextEditor(QWidget *parent)
    : QTextEdit(parent)
{
    setObjectName("richTextEditor");

    QString chosenFamily = "Noto Naskh Arabic";
    const QStringList preferredFamilies = {
        "Noto Nastaliq Urdu",
        "Jameel Noori Nastaleeq",
        "Noto Naskh Arabic",
        "Amiri"
    };
    const QStringList availableFamilies = QFontDatabase().families();
    for (const QString &candidate : preferredFamilies) {
        if (availableFamilies.contains(candidate)) {
            chosenFamily = candidate;
            break;
        }
    }
    QFont f(chosenFamily);
    f.setPointSizeF(BASE_FONT_POINT_SIZE);
    setFont(f);

    // Line wrap width is driven by PageView from the content width
    setLineWrapMode(QTextEdit::FixedPixelWidth);
    setViewportMargins(0, 0, 0, 0);
    setAcceptRichText(true);
    document()->setDocumentMargin(0);

    applyDirection();
}

void RichTextEditor::setRightToLeft(bool rtl)
{
    if (m_rtl == rtl) {
        return;
    }
    m_rtl = rtl;
    applyDirection();
}

void RichTextEditor::applyDirection()
{
    const Qt::LayoutDirection direction = m_rtl ? Qt::RightToLeft : Qt::LeftToRight;
    setLayoutDirection(direction);

    QTextOption option = document()->defaultTextOption();
    option.setTextDirection(direction);
    option.setAlignment(m_rtl ? (Qt::AlignRight | Qt::AlignAbsolute) : Qt::AlignLeft);
    document()->setDefaultTextOption(option);
    qDebug() << "[RichTextEditor] Direction:" << (m_rtl ? "RTL" : "LTR");
}

QString RichTextEditor::insertManualPageBreak()
{
    QTextCursor c = textCursor();
    if (c.hasSelection()) {
        c.clearSelection();
    }

    const QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    QTextBlockFormat markerFormat;
    markerFormat.setProperty(TextEditContentSurface::MarkerIdProperty, id);
    markerFormat.setProperty(TextEditContentSurface::MarkerManualProperty, true);
    markerFormat.setPageBreakPolicy(QTextFormat::PageBreak_AlwaysAfter);

    c.beginEditBlock();
    const QTextBlockFormat contentFormat = c.blockFormat();
    const QTextCharFormat contentCharFormat = c.charFormat();
    if (c.positionInBlock() > 0) {
        // Split so the break sits between the text before and after the caret
        c.insertBlock(contentFormat, contentCharFormat);
    }
    c.insertBlock(contentFormat, contentCharFormat);
    const int caretPosition = c.position();
    c.movePosition(QTextCursor::PreviousBlock);
    c.setBlockFormat(markerFormat);
    c.setPosition(caretPosition);
    c.endEditBlock();
    setTextCursor(c);

    qDebug() << "[RichTextEditor] Inserted manual page break" << id;
    emit pageBreakInserted(id);
    return id;
}

bool RichTextEditor::removeManualPageBreak(const QString &markerId)
{
    const QTextBlock block = findMarkerBlock(markerId);
    if (!block.isValid()) {
        return false;
    }

    QTextCursor c(document());
    if (!block.text().isEmpty()) {
        // Text was merged into the marker block: keep it, drop the marker
        QTextBlockFormat fmt = block.blockFormat();
        fmt.clearProperty(TextEditContentSurface::MarkerIdProperty);
        fmt.clearProperty(TextEditContentSurface::MarkerManualProperty);
        fmt.setPageBreakPolicy(QTextFormat::PageBreak_Auto);
        c.setPosition(block.position());
        c.setBlockFormat(fmt);
        QTextBlock detached = block;
        detached.setUserData(nullptr);
        qDebug() << "[RichTextEditor] Detached page break marker" << markerId << "from merged text";
        emit pageBreakRemoved(markerId);
        return true;
    }

    c.beginEditBlock();
    c.setPosition(block.position());
    c.movePosition(QTextCursor::EndOfBlock, QTextCursor::KeepAnchor);
    c.removeSelectedText();
    if (block.previous().isValid()) {
        // Merging into the previous block drops the marker format with it
        c.deletePreviousChar();
    } else {
        c.setBlockFormat(QTextBlockFormat());
    }
    c.endEditBlock();

    qDebug() << "[RichTextEditor] Removed manual page break" << markerId;
    emit pageBreakRemoved(markerId);
    return true;
}

QStringList RichTextEditor::manualPageBreakIds() const
{
    QStringList ids;
    for (QTextBlock b = document()->begin(); b.isValid(); b = b.next()) {
        if (TextEditContentSurface::isMarkerBlock(b)) {
            ids << b.blockFormat().stringProperty(TextEditContentSurface::MarkerIdProperty);
        }
    }
    return ids;
}

bool RichTextEditor::setMarkerPageNumber(const QString &markerId, int pageNumber)
{
    QTextBlock block = findMarkerBlock(markerId);
    if (!block.isValid()) {
        return false;
    }
    if (auto *data = dynamic_cast<PageBreakBlockData *>(block.userData())) {
        data->pageNumber = pageNumber;
    } else {
        block.setUserData(new PageBreakBlockData(pageNumber));
    }
    return true;
}

int RichTextEditor::markerPageNumber(const QString &markerId) const
{
    const QTextBlock block = findMarkerBlock(markerId);
    const auto *data = dynamic_cast<const PageBreakBlockData *>(block.userData());
    return data ? data->pageNumber : 0;
}

void RichTextEditor::setZoomFactor(double zoom)
{
    QFont editorFont = font();
    editorFont.setPointSizeF(BASE_FONT_POINT_SIZE * zoom);
    setFont(editorFont);
}

void RichTextEditor::clear()
{
    QTextEdit::clear();
    document()->setDocumentMargin(0);
    applyDirection();
}

void RichTextEditor::keyPressEvent(QKeyEvent *e)
{
    // Ctrl+Enter: word-processor page break
    if ((e->key() == Qt::Key_Return || e->key() == Qt::Key_Enter)
        && (e->modifiers() & Qt::ControlModifier)) {
        insertManualPageBreak();
        e->accept();
        return;
    }
    QTextEdit::keyPressEvent(e);
}

QTextBlock RichTextEditor::findMarkerBlock(const QString &markerId) const
{
    if (markerId.isEmpty()) {
        return QTextBlock();
    }
    for (QTextBlock b = document()->begin(); b.isValid(); b = b.next()) {
        if (b.blockFormat().stringProperty(TextEditContentSurface::MarkerIdProperty) == markerId) {
            return b;
        }
    }
    return QTextBlock();
}
