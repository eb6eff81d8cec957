#include "marginruler.h"

#include <QEvent>
#include <QFocusEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <cmath>

using Handle = MarginRulerController::Handle;

MarginRuler::MarginRuler(Qt::Orientation orientation, QWidget *parent)
    : QWidget(parent), m_orientation(orientation), m_controller(new MarginRulerController(this))
{
    setObjectName(orientation == Qt::Horizontal ? "horizontalRuler" : "verticalRuler");
    setMouseTracking(true);
    setFocusPolicy(Qt::ClickFocus);
    if (orientation == Qt::Horizontal) {
        setFixedHeight(RULER_THICKNESS);
    } else {
        setFixedWidth(RULER_THICKNESS);
    }

    connect(m_controller, &MarginRulerController::marginsChanged, this, [this] {
        update();
    });
}

void MarginRuler::setPageGeometry(double pageWidthMm, double pageHeightMm, double zoom, bool rtl)
{
    m_pageWidthMm = pageWidthMm;
    m_pageHeightMm = pageHeightMm;
    m_zoom = PageGeometry::clampZoom(zoom);
    m_rtl = rtl;
    m_controller->setZoom(m_zoom);
    m_controller->setRtl(rtl);
    update();
}

void MarginRuler::setMargins(const PageGeometry::Margins &margins)
{
    m_controller->setMargins(margins);
    update();
}

double MarginRuler::lengthMm() const
{
    return m_orientation == Qt::Horizontal ? m_pageWidthMm : m_pageHeightMm;
}

double MarginRuler::handlePositionPx(Handle handle) const
{
    const PageGeometry::HandlePositions pos = PageGeometry::rulerHandlePositions(
        m_controller->margins(), m_pageWidthMm, m_pageHeightMm, m_rtl);

    switch (handle) {
    case Handle::Left:
        return PageGeometry::mmToPx(pos.left, m_zoom);
    case Handle::Right:
        return PageGeometry::mmToPx(pos.right, m_zoom);
    case Handle::Top:
        return PageGeometry::mmToPx(pos.top, m_zoom);
    case Handle::Bottom:
        return PageGeometry::mmToPx(pos.bottom, m_zoom);
    case Handle::None:
        break;
    }
    return -1.0;
}

Handle MarginRuler::hitTest(const QPointF &pos) const
{
    const double coordinate = m_orientation == Qt::Horizontal ? pos.x() : pos.y();
    const Handle first = m_orientation == Qt::Horizontal ? Handle::Left : Handle::Top;
    const Handle second = m_orientation == Qt::Horizontal ? Handle::Right : Handle::Bottom;

    const double d1 = std::abs(coordinate - handlePositionPx(first));
    const double d2 = std::abs(coordinate - handlePositionPx(second));
    if (d1 <= HANDLE_HIT_PX && d1 <= d2) return first;
    if (d2 <= HANDLE_HIT_PX) return second;
    return Handle::None;
}

double MarginRuler::tickScreenPosition(double px) const
{
    // RTL rulers count from the right edge
    if (m_orientation == Qt::Horizontal && m_rtl) {
        return PageGeometry::mmToPx(m_pageWidthMm, m_zoom) - px;
    }
    return px;
}

void MarginRuler::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);
    QPainter p(this);
    p.fillRect(rect(), QColor(58, 62, 70));

    const bool horizontal = m_orientation == Qt::Horizontal;
    const Handle first = horizontal ? Handle::Left : Handle::Top;
    const Handle second = horizontal ? Handle::Right : Handle::Bottom;
    const double start = handlePositionPx(first);
    const double end = handlePositionPx(second);

    // Content zone between the margins
    const QRectF zone = horizontal ? QRectF(start, 0, end - start, height())
                                   : QRectF(0, start, width(), end - start);
    p.fillRect(zone, QColor(236, 238, 242));

    QFont labelFont = font();
    labelFont.setPointSize(LABEL_FONT_SIZE);
    p.setFont(labelFont);
    p.setPen(QColor(110, 116, 128));
    for (const PageGeometry::TickMark &tick : PageGeometry::rulerTicks(lengthMm(), m_zoom)) {
        const double at = tickScreenPosition(tick.position);
        const int length = tick.isMajor ? TICK_MAJOR_LENGTH : TICK_MINOR_LENGTH;
        if (horizontal) {
            p.drawLine(QPointF(at, height() - length), QPointF(at, height()));
        } else {
            p.drawLine(QPointF(width() - length, at), QPointF(width(), at));
        }
        if (tick.isMajor && tick.valueMm > 0) {
            const QString label = QString::number(tick.valueMm / 10);
            if (horizontal) {
                p.drawText(QRectF(at - 10, 0, 20, height() - length), Qt::AlignCenter, label);
            } else {
                p.drawText(QRectF(0, at - 6, width() - length, 12), Qt::AlignCenter, label);
            }
        }
    }

    p.setRenderHint(QPainter::Antialiasing, true);
    const Handle active = m_controller->activeHandle();
    for (Handle handle : {first, second}) {
        const double at = handlePositionPx(handle);
        QPainterPath marker;
        if (horizontal) {
            marker.moveTo(at - HANDLE_SIZE / 2.0, 0);
            marker.lineTo(at + HANDLE_SIZE / 2.0, 0);
            marker.lineTo(at, HANDLE_SIZE);
        } else {
            marker.moveTo(0, at - HANDLE_SIZE / 2.0);
            marker.lineTo(0, at + HANDLE_SIZE / 2.0);
            marker.lineTo(HANDLE_SIZE, at);
        }
        marker.closeSubpath();
        p.fillPath(marker, handle == active ? QColor(74, 144, 226) : QColor(90, 98, 112));
    }
}

void MarginRuler::mousePressEvent(QMouseEvent *event)
{
    const Handle handle = hitTest(event->pos());
    if (handle == Handle::None || event->button() != Qt::LeftButton) {
        QWidget::mousePressEvent(event);
        return;
    }
    m_controller->pointerDown(handle, event->pos());
    update();
    event->accept();
}

void MarginRuler::mouseMoveEvent(QMouseEvent *event)
{
    if (m_controller->isDragging()) {
        m_controller->pointerMove(event->pos());
        event->accept();
        return;
    }

    const Handle hover = hitTest(event->pos());
    if (hover == Handle::None) {
        unsetCursor();
    } else {
        setCursor(m_orientation == Qt::Horizontal ? Qt::SizeHorCursor : Qt::SizeVerCursor);
    }
    QWidget::mouseMoveEvent(event);
}

void MarginRuler::mouseReleaseEvent(QMouseEvent *event)
{
    if (m_controller->isDragging()) {
        m_controller->pointerUp(event->pos());
        update();
        event->accept();
        return;
    }
    QWidget::mouseReleaseEvent(event);
}

void MarginRuler::focusOutEvent(QFocusEvent *event)
{
    m_controller->pointerCancel();
    QWidget::focusOutEvent(event);
}

void MarginRuler::changeEvent(QEvent *event)
{
    if (event->type() == QEvent::ActivationChange && !isActiveWindow()) {
        m_controller->pointerCancel();
    }
    QWidget::changeEvent(event);
}
