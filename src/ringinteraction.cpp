/*
 * SelfieLight - Drag and resize handling for the ring light
 * License: MIT
 */

#include "ringinteraction.h"
#include "layout.h"

#include <QtGlobal>
#include <cmath>

RingInteraction::Hit RingInteraction::hitTest(const QPoint &local, int size) {
    const double outer = size / 2.0;
    const double inner = outer * InnerRatio;
    const double d = std::hypot(local.x() - outer, local.y() - outer);

    if (d < inner || d > outer)
        return Hit::None;
    if (outer - d <= EdgeTolerance || d - inner <= EdgeTolerance)
        return Hit::Edge;
    return Hit::Ring;
}

Qt::CursorShape RingInteraction::cursorFor(Hit hit) {
    switch (hit) {
    case Hit::Edge: return Qt::SizeFDiagCursor;
    case Hit::Ring: return Qt::SizeAllCursor;
    case Hit::None: break;
    }
    return Qt::ArrowCursor;
}

QPointF RingInteraction::centerOf(const QRect &geometry) {
    return QPointF(geometry.x() + geometry.width() / 2.0,
                   geometry.y() + geometry.height() / 2.0);
}

QRect RingInteraction::resizedAround(const QPointF &center, const QPoint &cursor) {
    const double d = std::hypot(cursor.x() - center.x(), cursor.y() - center.y());
    const int size = qMax(Layout::MinRingSize, qRound(2.0 * d));
    return QRect(qRound(center.x() - size / 2.0), qRound(center.y() - size / 2.0), size, size);
}

bool RingInteraction::press(const QPoint &local, const QPoint &global, const QRect &geometry) {
    switch (hitTest(local, geometry.width())) {
    case Hit::None:
        m_state = State::Idle;
        return false;
    case Hit::Edge:
        m_state = State::Resizing;
        break;
    case Hit::Ring:
        m_state = State::Moving;
        break;
    }
    m_pressPos = global;
    m_center = centerOf(geometry);
    m_startGeometry = geometry;
    m_geometry = geometry;
    return true;
}

bool RingInteraction::drag(const QPoint &global, QRect *geometry) {
    QRect next;
    switch (m_state) {
    case State::Idle:
        return false;
    case State::Moving:
        next = m_startGeometry.translated(global - m_pressPos);
        break;
    case State::Resizing:
        next = resizedAround(m_center, global);
        break;
    }

    if (next == m_geometry) return false;
    m_geometry = next;
    *geometry = next;
    return true;
}

bool RingInteraction::release() {
    const bool wasActive = m_state != State::Idle;
    m_state = State::Idle;
    return wasActive;
}
