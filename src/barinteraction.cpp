/*
 * SelfieLight - Drag and resize handling for rectangular bars
 * License: MIT
 */

#include "barinteraction.h"
#include "layout.h"

BarInteraction::Edge BarInteraction::edgeAt(const QPoint &local, const QSize &size) {
    if (local.x() < EdgeMargin) return Edge::Left;
    if (local.x() >= size.width() - EdgeMargin) return Edge::Right;
    if (local.y() < EdgeMargin) return Edge::Top;
    if (local.y() >= size.height() - EdgeMargin) return Edge::Bottom;
    return Edge::None;
}

Qt::CursorShape BarInteraction::cursorFor(Edge edge) {
    switch (edge) {
    case Edge::Left:
    case Edge::Right:
        return Qt::SizeHorCursor;
    case Edge::Top:
    case Edge::Bottom:
        return Qt::SizeVerCursor;
    case Edge::None:
        break;
    }
    return Qt::ArrowCursor;
}

void BarInteraction::press(const QPoint &local, const QPoint &global, const QRect &geometry) {
    m_edge = edgeAt(local, geometry.size());
    m_state = m_edge == Edge::None ? State::Moving : State::Resizing;
    m_pressPos = global;
    m_startGeometry = geometry;
    m_geometry = geometry;
}

bool BarInteraction::drag(const QPoint &global, QRect *geometry) {
    if (m_state == State::Idle) return false;

    const QPoint delta = global - m_pressPos;
    const QRect &s = m_startGeometry;
    QRect next;

    if (m_state == State::Moving) {
        next = s.translated(delta);
    } else {
        int w = s.width();
        int h = s.height();
        switch (m_edge) {
        case Edge::Left:   w = s.width() - delta.x(); break;
        case Edge::Right:  w = s.width() + delta.x(); break;
        case Edge::Top:    h = s.height() - delta.y(); break;
        case Edge::Bottom: h = s.height() + delta.y(); break;
        case Edge::None:   break;
        }

        if (w < Layout::MinBarSize || h < Layout::MinBarSize) return false;

        // Keep the opposite edge where it was at press time
        int x = s.x();
        int y = s.y();
        if (m_edge == Edge::Left) x = s.x() + s.width() - w;
        if (m_edge == Edge::Top) y = s.y() + s.height() - h;
        next = QRect(x, y, w, h);
    }

    if (next == m_geometry) return false;
    m_geometry = next;
    *geometry = next;
    return true;
}

void BarInteraction::release() {
    m_state = State::Idle;
    m_edge = Edge::None;
}
