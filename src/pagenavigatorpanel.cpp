#include "pagenavigatorpanel.h"

#include "pageview.h"

#include <QFrame>
#include <QLabel>
#include <QListWidget>
#include <QSizePolicy>
#include <QVBoxLayout>

namespace {
constexpr int PageIndexRole = Qt::UserRole + 1;
constexpr int PREVIEW_CHARS = 40;

QString firstLineOf(const Page &page)
{
    for (const DocumentNode &node : page.content) {
        const QString text = node.plainText().section(QLatin1Char('\n'), 0, 0).trimmed();
        if (!text.isEmpty()) {
            return text.length() > PREVIEW_CHARS ? text.left(PREVIEW_CHARS) + QStringLiteral("...") : text;
        }
    }
    return QString();
}
}

PageNavigatorPanel::PageNavigatorPanel(QWidget *parent)
    : QWidget(parent)
{
    setMinimumHeight(90);
    setSizePolicy(QSizePolicy::Preferred, QSizePolicy::Expanding);

    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(10, 10, 10, 10);
    layout->setSpacing(8);

    auto *title = new QLabel(tr("Pages"), this);
    title->setStyleSheet("font-weight: 700; font-size: 13px; color: #111827; padding: 0 2px;");
    layout->addWidget(title);

    m_pageCountLabel = new QLabel(tr("1 page"), this);
    m_pageCountLabel->setStyleSheet("color: #6b7280; font-size: 11px; padding: 0 2px;");
    layout->addWidget(m_pageCountLabel);

    QFrame *listCard = new QFrame(this);
    listCard->setStyleSheet(
        "QFrame {"
        "  background: #ffffff;"
        "  border: 1px solid #d0d7de;"
        "  border-radius: 10px;"
        "}"
    );
    auto *cardLayout = new QVBoxLayout(listCard);
    cardLayout->setContentsMargins(4, 4, 4, 4);
    cardLayout->setSpacing(0);

    m_pageList = new QListWidget(listCard);
    m_pageList->setStyleSheet(
        "QListWidget {"
        "  border: none;"
        "  background: #ffffff;"
        "  padding: 2px;"
        "}"
        "QListWidget::item {"
        "  padding: 7px 8px;"
        "  border-radius: 6px;"
        "  color: #24292f;"
        "}"
        "QListWidget::item:hover { background: #f3f4f6; }"
        "QListWidget::item:selected { background: #dbeafe; color: #1e3a8a; font-weight: 600; }"
    );
    cardLayout->addWidget(m_pageList, 1);
    layout->addWidget(listCard, 1);

    connect(m_pageList, &QListWidget::itemClicked, this, &PageNavigatorPanel::goToPage);
}

void PageNavigatorPanel::setPageView(PageView *pageView)
{
    if (m_pageView == pageView) {
        return;
    }

    if (m_pageView) {
        disconnect(m_pageView, nullptr, this, nullptr);
    }

    m_pageView = pageView;

    if (m_pageView) {
        connect(m_pageView, &PageView::paginationChanged, this, &PageNavigatorPanel::refreshPages);
        connect(m_pageView, &PageView::currentPageChanged, this, &PageNavigatorPanel::syncSelectionToPage);
    }

    refreshPages();
}

int PageNavigatorPanel::entryCount() const
{
    return m_pageList->count();
}

QString PageNavigatorPanel::entryText(int row) const
{
    const QListWidgetItem *item = m_pageList->item(row);
    return item ? item->text() : QString();
}

void PageNavigatorPanel::refreshPages()
{
    m_pageList->clear();

    if (!m_pageView) {
        return;
    }

    const QVector<Page> pages = m_pageView->pages();
    for (const Page &page : pages) {
        QString preview = firstLineOf(page);
        if (preview.isEmpty()) {
            preview = tr("(empty)");
        }
        const QString label = QString("%1. %2").arg(page.index + 1).arg(preview);
        auto *item = new QListWidgetItem(label, m_pageList);
        item->setData(PageIndexRole, page.index);
        item->setToolTip(m_pageView->pageLabel(page.index));
    }

    const int count = pages.size();
    m_pageCountLabel->setText(count == 1 ? tr("1 page") : tr("%1 pages").arg(count));

    syncSelectionToPage(m_pageView->currentPage());
}

void PageNavigatorPanel::goToPage(QListWidgetItem *item)
{
    if (!m_pageView || !item || m_updatingSelection) {
        return;
    }
    m_pageView->goToPage(item->data(PageIndexRole).toInt());
}

void PageNavigatorPanel::syncSelectionToPage(int page)
{
    if (m_pageList->count() == 0) {
        return;
    }

    m_updatingSelection = true;
    if (page >= 0 && page < m_pageList->count()) {
        m_pageList->setCurrentRow(page);
    } else {
        m_pageList->clearSelection();
    }
    m_updatingSelection = false;
}
