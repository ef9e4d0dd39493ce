/*
 * SelfieLight - Rectangular light bar window
 *
 * Drag inside a bar to move it, drag within 10px of an edge to resize.
 * Right click opens the menu.
 * License: MIT
 */

#include "lightbar.h"
#include "logging.h"
#include "overlay.h"

#include <QMouseEvent>
#include <QPainter>

LightBar::LightBar(const SurfaceSpec &spec, QScreen *screen, SurfaceObserver *observer)
    : m_role(spec.role), m_bounds(spec.geometry), m_origin(spec.geometry.topLeft())
    , m_screen(screen), m_observer(observer)
{
    Overlay::prepare(this, screen);
    Overlay::place(this, m_bounds, screen);
}

void LightBar::setColor(const QColor &color) {
    m_color = color;
    update();
}

void LightBar::close() {
    if (m_closed) return;
    m_closed = true;
    hide();
    // May be called from inside one of our own event handlers
    deleteLater();
}

void LightBar::paintEvent(QPaintEvent *) {
    // This frame carries the margins from the last place()
    m_origin = m_bounds.topLeft();
    QPainter(this).fillRect(0, 0, width(), height(), m_color);
}

void LightBar::mousePressEvent(QMouseEvent *event) {
    const QPoint global = Overlay::globalPos(event, m_origin);

    if (event->button() == Qt::RightButton) {
        if (m_observer) m_observer->contextMenuRequested(global);
        return;
    }
    if (event->button() != Qt::LeftButton) return;

    m_interaction.press(event->position().toPoint(), global, m_bounds);
    qCDebug(lcSurface) << roleName(m_role) << "bar"
                       << (m_interaction.state() == BarInteraction::State::Moving ? "move" : "resize")
                       << "from" << m_bounds;
}

void LightBar::mouseMoveEvent(QMouseEvent *event) {
    if (!m_interaction.isActive()) {
        setCursor(BarInteraction::cursorFor(
            BarInteraction::edgeAt(event->position().toPoint(), size())));
        return;
    }

    QRect next;
    if (!m_interaction.drag(Overlay::globalPos(event, m_origin), &next)) return;

    m_bounds = next;
    Overlay::place(this, m_bounds, m_screen);
    update();

    // The controller recreates every border bar, this one included, so the
    // grab and this drag end with the first accepted tick
    if (m_role == Role::Border && m_observer &&
        m_interaction.state() == BarInteraction::State::Resizing) {
        m_observer->borderThicknessChanged(qMin(next.width(), next.height()));
    }
}

void LightBar::mouseReleaseEvent(QMouseEvent *event) {
    if (event->button() != Qt::LeftButton) return;
    m_interaction.release();
}
