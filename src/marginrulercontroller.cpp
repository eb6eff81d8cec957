#include "marginrulercontroller.h"

#include <QDebug>
#include <QTimer>

using PageGeometry::Margins;

MarginRulerController::MarginRulerController(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<PageGeometry::Margins>();

    m_frameTimer = new QTimer(this);
    m_frameTimer->setSingleShot(true);
    m_frameTimer->setInterval(FRAME_INTERVAL_MS);
    connect(m_frameTimer, &QTimer::timeout, this, &MarginRulerController::applyPendingMove);
}

bool MarginRulerController::pointerDown(Handle handle, const QPointF &pos)
{
    if (handle == Handle::None) {
        return false;
    }
    m_drag.handle = handle;
    m_drag.startPos = pos;
    m_drag.startMargins = m_margins;
    m_hasPendingMove = false;
    emit dragStarted(handle);
    return true;
}

void MarginRulerController::pointerMove(const QPointF &pos)
{
    if (!isDragging()) {
        return;
    }
    // Latest position wins; applied once per frame
    m_pendingPos = pos;
    m_hasPendingMove = true;
    if (!m_frameTimer->isActive()) {
        m_frameTimer->start();
    }
}

void MarginRulerController::pointerUp(const QPointF &pos)
{
    if (!isDragging()) {
        return;
    }
    m_frameTimer->stop();
    m_pendingPos = pos;
    m_hasPendingMove = true;
    applyPendingMove();

    m_drag = DragState();
    emit dragFinished(m_margins);
}

void MarginRulerController::pointerCancel()
{
    if (!isDragging()) {
        return;
    }
    qDebug() << "[MarginRuler] Drag cancelled";
    m_frameTimer->stop();
    m_hasPendingMove = false;
    m_drag = DragState();
    emit dragFinished(m_margins);
}

Margins MarginRulerController::applyDrag(Handle handle,
                                         const Margins &startMargins,
                                         const QPointF &deltaPx,
                                         double zoom,
                                         bool rtl)
{
    const double z = PageGeometry::clampZoom(zoom);
    const double dx = PageGeometry::pxToMm(deltaPx.x(), z);
    const double dy = PageGeometry::pxToMm(deltaPx.y(), z);

    Margins result = startMargins;
    switch (handle) {
    case Handle::Left:
        if (rtl) {
            result.right = PageGeometry::clampMargin(startMargins.right + dx);
        } else {
            result.left = PageGeometry::clampMargin(startMargins.left + dx);
        }
        break;
    case Handle::Right:
        if (rtl) {
            result.left = PageGeometry::clampMargin(startMargins.left - dx);
        } else {
            result.right = PageGeometry::clampMargin(startMargins.right - dx);
        }
        break;
    case Handle::Top:
        result.top = PageGeometry::clampMargin(startMargins.top + dy);
        break;
    case Handle::Bottom:
        result.bottom = PageGeometry::clampMargin(startMargins.bottom - dy);
        break;
    case Handle::None:
        break;
    }
    return result;
}

void MarginRulerController::applyPendingMove()
{
    if (!isDragging() || !m_hasPendingMove) {
        return;
    }
    m_hasPendingMove = false;

    const Margins next = applyDrag(m_drag.handle, m_drag.startMargins,
                                   m_pendingPos - m_drag.startPos, m_zoom, m_rtl);
    if (next == m_margins) {
        return;
    }
    m_margins = next;
    emit marginsChanged(m_margins);
}
