#include "paginationbar.h"

#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QSpinBox>

PaginationBar::PaginationBar(QWidget *parent)
    : QFrame(parent)
{
    setObjectName("paginationBar");

    auto *layout = new QHBoxLayout(this);
    layout->setContentsMargins(8, 6, 8, 6);
    layout->setSpacing(6);

    m_prevButton = new QPushButton(tr("Previous"), this);
    m_nextButton = new QPushButton(tr("Next"), this);
    layout->addWidget(m_prevButton);

    m_statusLabel = new QLabel(this);
    m_statusLabel->setAlignment(Qt::AlignCenter);
    m_statusLabel->setMinimumWidth(110);
    layout->addWidget(m_statusLabel);
    layout->addWidget(m_nextButton);

    layout->addStretch(1);

    auto *goToLabel = new QLabel(tr("Go to page"), this);
    layout->addWidget(goToLabel);

    // Spin box is 1-based; signals carry 0-based page indexes
    m_goToSpin = new QSpinBox(this);
    m_goToSpin->setMinimum(1);
    m_goToSpin->setKeyboardTracking(false);
    layout->addWidget(m_goToSpin);

    connect(m_prevButton, &QPushButton::clicked, this, &PaginationBar::previousRequested);
    connect(m_nextButton, &QPushButton::clicked, this, &PaginationBar::nextRequested);
    connect(m_goToSpin, QOverload<int>::of(&QSpinBox::valueChanged), this, [this](int value) {
        if (!m_updating) {
            emit goToPageRequested(value - 1);
        }
    });

    setPageStatus(0, 1);
}

void PaginationBar::setPageStatus(int currentPage, int pageCount)
{
    if (pageCount < 1) pageCount = 1;
    currentPage = qBound(0, currentPage, pageCount - 1);

    m_updating = true;
    m_goToSpin->setMaximum(pageCount);
    m_goToSpin->setValue(currentPage + 1);
    m_updating = false;

    m_statusLabel->setText(tr("Page %1 of %2").arg(currentPage + 1).arg(pageCount));
    m_prevButton->setEnabled(currentPage > 0);
    m_nextButton->setEnabled(currentPage < pageCount - 1);
    setVisible(pageCount > 1);
}

QString PaginationBar::statusText() const
{
    return m_statusLabel->text();
}
