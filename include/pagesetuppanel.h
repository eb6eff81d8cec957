#pragma once
#include <QWidget>
#include "pagegeometry.h"

class QCheckBox;
class QComboBox;
class QDoubleSpinBox;
class QLabel;
class PageView;

class PageSetupPanel : public QWidget {
    Q_OBJECT
public:
    explicit PageSetupPanel(QWidget *parent = nullptr);

    void setPageView(PageView *pageView);

    PageGeometry::MarginUnit unit() const { return m_unit; }
    void setUnit(PageGeometry::MarginUnit unit);

    // Displayed margin for one side in the current unit, e.g. "20" or "0.787"
    QString marginText(const QString &side) const;

signals:
    void unitChanged(PageGeometry::MarginUnit unit);

private slots:
    void syncFromView();

private:
    enum Side { Top, Bottom, Left, Right, SideCount };

    void applyPageSize();
    void applyMargin(Side side, double displayValue);
    void updateMarginRanges();

    PageView *m_pageView = nullptr;
    PageGeometry::MarginUnit m_unit = PageGeometry::MarginUnit::Millimeters;
    QComboBox *m_sizeCombo = nullptr;
    QDoubleSpinBox *m_customWidth = nullptr;
    QDoubleSpinBox *m_customHeight = nullptr;
    QComboBox *m_orientationCombo = nullptr;
    QComboBox *m_unitCombo = nullptr;
    QDoubleSpinBox *m_marginSpins[SideCount];
    QCheckBox *m_guidesCheck = nullptr;
    QCheckBox *m_rtlCheck = nullptr;
    bool m_updating = false;
};
