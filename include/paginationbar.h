#pragma once

#include <QFrame>

class QLabel;
class QPushButton;
class QSpinBox;

class PaginationBar : public QFrame {
    Q_OBJECT
public:
    explicit PaginationBar(QWidget *parent = nullptr);

    void setPageStatus(int currentPage, int pageCount);
    QString statusText() const;

signals:
    void previousRequested();
    void nextRequested();
    void goToPageRequested(int pageIndex);

private:
    QPushButton *m_prevButton = nullptr;
    QPushButton *m_nextButton = nullptr;
    QLabel *m_statusLabel = nullptr;
    QSpinBox *m_goToSpin = nullptr;
    bool m_updating = false;
};
