/*
 * SelfieLight - Drag and resize handling for rectangular bars
 * License: MIT
 */

#pragma once

#include <QPoint>
#include <QRect>
#include <QSize>
#include <Qt>

/*
 * Press/drag/release state machine of a bar. Positions handed to press()
 * and drag() are in screen coordinates, edge detection works on window
 * local coordinates. Deltas are always taken from the press position so
 * rejected steps do not accumulate.
 */
class BarInteraction {
public:
    enum class State { Idle, Moving, Resizing };
    enum class Edge { None, Left, Right, Top, Bottom };

    static constexpr int EdgeMargin = 10;

    static Edge edgeAt(const QPoint &local, const QSize &size);
    static Qt::CursorShape cursorFor(Edge edge);

    State state() const { return m_state; }
    Edge edge() const { return m_edge; }
    bool isActive() const { return m_state != State::Idle; }

    void press(const QPoint &local, const QPoint &global, const QRect &geometry);

    // Computes the geometry for the cursor at global. Returns false when
    // idle, unchanged, or when the result would be smaller than the
    // minimum bar size; geometry is left untouched in that case.
    bool drag(const QPoint &global, QRect *geometry);

    void release();

private:
    State m_state = State::Idle;
    Edge m_edge = Edge::None;
    QPoint m_pressPos;
    QRect m_startGeometry;
    QRect m_geometry;
};
