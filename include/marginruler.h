#pragma once
#include <QWidget>

#include "marginrulercontroller.h"
#include "pagegeometry.h"

class MarginRuler : public QWidget {
    Q_OBJECT
public:
    explicit MarginRuler(Qt::Orientation orientation, QWidget *parent = nullptr);

    MarginRulerController *controller() const { return m_controller; }
    Qt::Orientation orientation() const { return m_orientation; }

    void setPageGeometry(double pageWidthMm, double pageHeightMm, double zoom, bool rtl);
    void setMargins(const PageGeometry::Margins &margins);

    // Handle under pos, within HANDLE_HIT_PX
    MarginRulerController::Handle hitTest(const QPointF &pos) const;
    double handlePositionPx(MarginRulerController::Handle handle) const;

    static constexpr int RULER_THICKNESS = 24;
    static constexpr int HANDLE_HIT_PX = 4;

protected:
    void paintEvent(QPaintEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void focusOutEvent(QFocusEvent *event) override;
    void changeEvent(QEvent *event) override;

private:
    double lengthMm() const;
    double tickScreenPosition(double px) const;

    Qt::Orientation m_orientation;
    MarginRulerController *m_controller;
    double m_pageWidthMm = PageGeometry::A4_WIDTH_MM;
    double m_pageHeightMm = PageGeometry::A4_HEIGHT_MM;
    double m_zoom = PageGeometry::DEFAULT_ZOOM;
    bool m_rtl = true;

    static constexpr int TICK_MINOR_LENGTH = 5;
    static constexpr int TICK_MAJOR_LENGTH = 10;
    static constexpr int HANDLE_SIZE = 8;
    static constexpr int LABEL_FONT_SIZE = 7;
};
