/*
 * SelfieLight - Drag and resize handling for the ring light
 * License: MIT
 */

#pragma once

#include <QPoint>
#include <QPointF>
#include <QRect>
#include <Qt>

class RingInteraction {
public:
    enum class State { Idle, Moving, Resizing };
    enum class Hit { None, Ring, Edge };

    static constexpr int EdgeTolerance = 20;
    // Ring thickness is 30% of the outer radius
    static constexpr double InnerRatio = 0.7;

    // local is relative to the ring's bounding square of side size
    static Hit hitTest(const QPoint &local, int size);
    static Qt::CursorShape cursorFor(Hit hit);

    static QPointF centerOf(const QRect &geometry);
    // Square of diameter 2 * |cursor - center|, at least MinRingSize,
    // centered on center.
    static QRect resizedAround(const QPointF &center, const QPoint &cursor);

    State state() const { return m_state; }
    bool isActive() const { return m_state != State::Idle; }

    // Returns false when the press lands in the hole or outside the ring
    bool press(const QPoint &local, const QPoint &global, const QRect &geometry);
    bool drag(const QPoint &global, QRect *geometry);
    // Returns true if a move or resize was in progress
    bool release();

private:
    State m_state = State::Idle;
    QPoint m_pressPos;
    QPointF m_center;
    QRect m_startGeometry;
    QRect m_geometry;
};
