#pragma once

#include <QMetaType>
#include <QObject>
#include <QPointF>

#include "pagegeometry.h"

class QTimer;

class MarginRulerController : public QObject {
    Q_OBJECT
public:
    enum class Handle {
        None,
        Top,
        Bottom,
        Left,  // visual left edge of the content box
        Right  // visual right edge of the content box
    };
    Q_ENUM(Handle)

    static constexpr int FRAME_INTERVAL_MS = 16;

    explicit MarginRulerController(QObject *parent = nullptr);

    void setMargins(const PageGeometry::Margins &margins) { m_margins = margins; }
    const PageGeometry::Margins &margins() const { return m_margins; }
    void setZoom(double zoom) { m_zoom = PageGeometry::clampZoom(zoom); }
    double zoom() const { return m_zoom; }
    void setRtl(bool rtl) { m_rtl = rtl; }
    bool isRtl() const { return m_rtl; }

    bool isDragging() const { return m_drag.handle != Handle::None; }
    Handle activeHandle() const { return m_drag.handle; }

    bool pointerDown(Handle handle, const QPointF &pos);
    void pointerMove(const QPointF &pos);
    void pointerUp(const QPointF &pos);
    void pointerCancel();

    static PageGeometry::Margins applyDrag(Handle handle,
                                           const PageGeometry::Margins &startMargins,
                                           const QPointF &deltaPx,
                                           double zoom,
                                           bool rtl);

signals:
    void marginsChanged(const PageGeometry::Margins &margins);
    void dragStarted(MarginRulerController::Handle handle);
    void dragFinished(const PageGeometry::Margins &margins);

private:
    struct DragState {
        Handle handle = Handle::None;
        QPointF startPos;
        PageGeometry::Margins startMargins;
    };

    void applyPendingMove();

    PageGeometry::Margins m_margins;
    double m_zoom = PageGeometry::DEFAULT_ZOOM;
    bool m_rtl = true;
    DragState m_drag;
    QPointF m_pendingPos;
    bool m_hasPendingMove = false;
    QTimer *m_frameTimer = nullptr;
};

Q_DECLARE_METATYPE(PageGeometry::Margins)
