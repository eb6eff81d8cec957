#include "pagesetuppanel.h"
#include "pageview.h"
#include <QCheckBox>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QFrame>
#include <QLabel>
#include <QSizePolicy>
#include <QVBoxLayout>

namespace {
QString groupStyle()
{
    return QString(
        "QFrame#setupGroup {"
        "  background: #ffffff;"
        "  border: 1px solid #d0d7de;"
        "  border-radius: 10px;"
        "}"
    );
}

QLabel *sectionTitle(const QString &text, QWidget *parent)
{
    QLabel *label = new QLabel(text, parent);
    label->setStyleSheet("font-weight: 700; font-size: 13px; color: #111827; padding: 0 2px;");
    return label;
}
}

PageSetupPanel::PageSetupPanel(QWidget *parent)
    : QWidget(parent) {
    setMinimumHeight(90);
    setSizePolicy(QSizePolicy::Preferred, QSizePolicy::Expanding);
    setStyleSheet("background: #f4f6fb;");

    QVBoxLayout *layout = new QVBoxLayout(this);
    layout->setContentsMargins(10, 10, 10, 10);
    layout->setSpacing(8);

    // Paper
    layout->addWidget(sectionTitle(tr("Page Setup"), this));
    QFrame *paperGroup = new QFrame(this);
    paperGroup->setObjectName("setupGroup");
    paperGroup->setStyleSheet(groupStyle());
    QFormLayout *paperForm = new QFormLayout(paperGroup);

    m_sizeCombo = new QComboBox(paperGroup);
    for (PageGeometry::PageSize size : {PageGeometry::PageSize::A4, PageGeometry::PageSize::Letter,
                                        PageGeometry::PageSize::Custom}) {
        m_sizeCombo->addItem(PageGeometry::pageSizeName(size), static_cast<int>(size));
    }
    paperForm->addRow(tr("Size"), m_sizeCombo);

    m_customWidth = new QDoubleSpinBox(paperGroup);
    m_customHeight = new QDoubleSpinBox(paperGroup);
    for (QDoubleSpinBox *spin : {m_customWidth, m_customHeight}) {
        spin->setRange(PageGeometry::MIN_CUSTOM_DIMENSION_MM, PageGeometry::MAX_CUSTOM_DIMENSION_MM);
        spin->setDecimals(0);
        spin->setSuffix(" mm");
        spin->setKeyboardTracking(false);
    }
    paperForm->addRow(tr("Width"), m_customWidth);
    paperForm->addRow(tr("Height"), m_customHeight);

    m_orientationCombo = new QComboBox(paperGroup);
    m_orientationCombo->addItem(tr("Portrait"), static_cast<int>(PageGeometry::Orientation::Portrait));
    m_orientationCombo->addItem(tr("Landscape"), static_cast<int>(PageGeometry::Orientation::Landscape));
    paperForm->addRow(tr("Orientation"), m_orientationCombo);
    layout->addWidget(paperGroup);

    // Margins
    layout->addWidget(sectionTitle(tr("Margins"), this));
    QFrame *marginGroup = new QFrame(this);
    marginGroup->setObjectName("setupGroup");
    marginGroup->setStyleSheet(groupStyle());
    QFormLayout *marginForm = new QFormLayout(marginGroup);

    m_unitCombo = new QComboBox(marginGroup);
    m_unitCombo->addItem(tr("Millimeters"), static_cast<int>(PageGeometry::MarginUnit::Millimeters));
    m_unitCombo->addItem(tr("Inches"), static_cast<int>(PageGeometry::MarginUnit::Inches));
    marginForm->addRow(tr("Unit"), m_unitCombo);

    const QStringList sideNames = { tr("Top"), tr("Bottom"), tr("Left"), tr("Right") };
    for (int i = 0; i < SideCount; ++i) {
        m_marginSpins[i] = new QDoubleSpinBox(marginGroup);
        m_marginSpins[i]->setKeyboardTracking(false);
        marginForm->addRow(sideNames[i], m_marginSpins[i]);

        const Side side = static_cast<Side>(i);
        connect(m_marginSpins[i], QOverload<double>::of(&QDoubleSpinBox::valueChanged), this,
                [this, side](double value) { applyMargin(side, value); });
    }

    m_guidesCheck = new QCheckBox(tr("Show margin guides"), marginGroup);
    marginForm->addRow(m_guidesCheck);
    layout->addWidget(marginGroup);

    m_rtlCheck = new QCheckBox(tr("Right-to-left"), this);
    m_rtlCheck->setChecked(true);
    layout->addWidget(m_rtlCheck);

    layout->addStretch();

    connect(m_sizeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this] { applyPageSize(); });
    connect(m_orientationCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this] { applyPageSize(); });
    connect(m_customWidth, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, [this] { applyPageSize(); });
    connect(m_customHeight, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, [this] { applyPageSize(); });
    connect(m_unitCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int index) {
        if (m_updating) return;
        setUnit(static_cast<PageGeometry::MarginUnit>(m_unitCombo->itemData(index).toInt()));
    });
    connect(m_guidesCheck, &QCheckBox::toggled, this, [this](bool checked) {
        if (m_pageView && !m_updating) m_pageView->setShowMarginGuides(checked);
    });
    connect(m_rtlCheck, &QCheckBox::toggled, this, [this](bool checked) {
        if (m_pageView && !m_updating) m_pageView->setRightToLeft(checked);
    });

    updateMarginRanges();
}

void PageSetupPanel::setPageView(PageView *pageView)
{
    if (m_pageView) {
        disconnect(m_pageView, nullptr, this, nullptr);
    }
    m_pageView = pageView;
    if (m_pageView) {
        connect(m_pageView, &PageView::pageLayoutChanged, this, &PageSetupPanel::syncFromView);
    }
    syncFromView();
}

void PageSetupPanel::setUnit(PageGeometry::MarginUnit unit)
{
    if (m_unit == unit) {
        return;
    }
    m_unit = unit;
    updateMarginRanges();
    syncFromView();
    emit unitChanged(m_unit);
}

QString PageSetupPanel::marginText(const QString &side) const
{
    static const QStringList names = { "top", "bottom", "left", "right" };
    const int index = names.indexOf(side.toLower());
    if (index < 0) {
        return QString();
    }
    return PageGeometry::formatDimension(m_marginSpins[index]->value(), m_unit);
}

void PageSetupPanel::updateMarginRanges()
{
    const bool inches = m_unit == PageGeometry::MarginUnit::Inches;
    m_updating = true;
    for (QDoubleSpinBox *spin : m_marginSpins) {
        spin->setDecimals(inches ? 3 : 0);
        spin->setSingleStep(inches ? 0.1 : 1.0);
        spin->setRange(PageGeometry::MIN_MARGIN_MM,
                       inches ? PageGeometry::MAX_MARGIN_INCHES : PageGeometry::MAX_MARGIN_MM);
        spin->setSuffix(inches ? " in" : " mm");
    }
    m_unitCombo->setCurrentIndex(m_unitCombo->findData(static_cast<int>(m_unit)));
    m_updating = false;
}

void PageSetupPanel::syncFromView()
{
    if (!m_pageView) {
        return;
    }
    const PageGeometry::PageLayout &layout = m_pageView->pageLayout();

    m_updating = true;
    m_sizeCombo->setCurrentIndex(m_sizeCombo->findData(static_cast<int>(layout.pageSize)));
    m_customWidth->setValue(layout.customWidth);
    m_customHeight->setValue(layout.customHeight);
    const bool custom = layout.pageSize == PageGeometry::PageSize::Custom;
    m_customWidth->setEnabled(custom);
    m_customHeight->setEnabled(custom);
    m_orientationCombo->setCurrentIndex(m_orientationCombo->findData(static_cast<int>(layout.orientation)));

    const double values[SideCount] = {
        layout.margins.top, layout.margins.bottom, layout.margins.left, layout.margins.right
    };
    for (int i = 0; i < SideCount; ++i) {
        m_marginSpins[i]->setValue(PageGeometry::toDisplayUnit(values[i], m_unit));
    }
    m_guidesCheck->setChecked(layout.showMarginGuides);
    m_rtlCheck->setChecked(m_pageView->isRightToLeft());
    m_updating = false;
}

void PageSetupPanel::applyPageSize()
{
    if (!m_pageView || m_updating) {
        return;
    }
    PageGeometry::PageLayout layout = m_pageView->pageLayout();
    layout.pageSize = static_cast<PageGeometry::PageSize>(m_sizeCombo->currentData().toInt());
    layout.orientation = static_cast<PageGeometry::Orientation>(m_orientationCombo->currentData().toInt());
    layout.customWidth = m_customWidth->value();
    layout.customHeight = m_customHeight->value();
    m_pageView->setPageLayout(layout);
}

void PageSetupPanel::applyMargin(Side side, double displayValue)
{
    if (!m_pageView || m_updating) {
        return;
    }
    // Only the edited side changes; the others keep full precision
    PageGeometry::Margins margins = m_pageView->pageLayout().margins;
    const double mm = PageGeometry::clampMargin(PageGeometry::fromDisplayUnit(displayValue, m_unit));
    switch (side) {
    case Top: margins.top = mm; break;
    case Bottom: margins.bottom = mm; break;
    case Left: margins.left = mm; break;
    case Right: margins.right = mm; break;
    case SideCount: break;
    }
    m_pageView->setMargins(margins);
}
