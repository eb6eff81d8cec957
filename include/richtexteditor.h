#pragma once
#include <QTextEdit>
#include <QStringList>

class QKeyEvent;
class QTextBlock;

class RichTextEditor : public QTextEdit {
    Q_OBJECT
public:
    explicit RichTextEditor(QWidget *parent = nullptr);

    void setRightToLeft(bool rtl);
    bool isRightToLeft() const { return m_rtl; }

    // Inserts a manual page break before the caret's block (splitting it at
    // the caret). Returns the new marker id, or an empty string on failure.
    QString insertManualPageBreak();
    bool removeManualPageBreak(const QString &markerId);
    QStringList manualPageBreakIds() const;
    // Page numbers are view state: setting one is not an undoable edit
    bool setMarkerPageNumber(const QString &markerId, int pageNumber);
    int markerPageNumber(const QString &markerId) const;

    void setZoomFactor(double zoom);

    static constexpr double BASE_FONT_POINT_SIZE = 14.0;

public slots:
    void clear();

protected:
    void keyPressEvent(QKeyEvent *e) override;

private:
    QTextBlock findMarkerBlock(const QString &markerId) const;
    void applyDirection();

    bool m_rtl = true;

signals:
    void pageBreakInserted(const QString &markerId);
    void pageBreakRemoved(const QString &markerId);
};
