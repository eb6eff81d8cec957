#pragma once

#include <QWidget>

class QListWidget;
class QListWidgetItem;
class QLabel;
class PageView;

class PageNavigatorPanel : public QWidget {
    Q_OBJECT
public:
    explicit PageNavigatorPanel(QWidget *parent = nullptr);

    void setPageView(PageView *pageView);
    int entryCount() const;
    QString entryText(int row) const;

public slots:
    void refreshPages();

private slots:
    void goToPage(QListWidgetItem *item);
    void syncSelectionToPage(int page);

private:
    PageView *m_pageView = nullptr;
    QListWidget *m_pageList = nullptr;
    QLabel *m_pageCountLabel = nullptr;
    bool m_updatingSelection = false;
};
