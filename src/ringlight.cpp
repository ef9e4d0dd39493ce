/*
 * SelfieLight - Circular ring light window
 *
 * Outer disc in the light color with the center punched out to full
 * transparency. The window mask matches the ring, so clicks on the hole
 * go to whatever is behind it. Drag the ring to move it, drag near one
 * of its edges to resize it around its center.
 * License: MIT
 */

#include "ringlight.h"
#include "logging.h"
#include "overlay.h"

#include <QMouseEvent>
#include <QPainter>
#include <QRegion>
#include <QSurfaceFormat>

RingLight::RingLight(const QRect &bounds, QScreen *screen, SurfaceObserver *observer)
    : m_bounds(bounds), m_origin(bounds.topLeft()), m_screen(screen), m_observer(observer)
{
    QSurfaceFormat fmt = format();
    fmt.setAlphaBufferSize(8);
    setFormat(fmt);

    Overlay::prepare(this, screen);
    Overlay::place(this, m_bounds, screen);
    updateMask();
}

void RingLight::setColor(const QColor &color) {
    m_color = color;
    update();
}

void RingLight::close() {
    if (m_closed) return;
    m_closed = true;
    hide();
    deleteLater();
}

void RingLight::updateMask() {
    const int size = m_bounds.width();
    const int inner = qRound(size * RingInteraction::InnerRatio);
    const int offset = (size - inner) / 2;
    QRegion ring(0, 0, size, size, QRegion::Ellipse);
    setMask(ring.subtracted(QRegion(offset, offset, inner, inner, QRegion::Ellipse)));
}

void RingLight::paintEvent(QPaintEvent *) {
    m_origin = m_bounds.topLeft();
    const int size = m_bounds.width();
    const double inner = size * RingInteraction::InnerRatio;
    const double offset = (size - inner) / 2.0;

    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing);
    p.setCompositionMode(QPainter::CompositionMode_Source);
    p.fillRect(QRect(0, 0, width(), height()), Qt::transparent);

    p.setPen(Qt::NoPen);
    p.setBrush(m_color);
    p.drawEllipse(QRectF(0, 0, size, size));

    // Source mode writes the transparent pixels instead of blending them
    p.setBrush(Qt::transparent);
    p.drawEllipse(QRectF(offset, offset, inner, inner));
}

void RingLight::resizeEvent(QResizeEvent *) {
    updateMask();
}

void RingLight::mousePressEvent(QMouseEvent *event) {
    const QPoint global = Overlay::globalPos(event, m_origin);

    if (event->button() == Qt::RightButton) {
        if (RingInteraction::hitTest(event->position().toPoint(), m_bounds.width()) ==
                RingInteraction::Hit::None) {
            return;
        }
        if (m_observer) m_observer->contextMenuRequested(global);
        return;
    }
    if (event->button() != Qt::LeftButton) return;

    if (!m_interaction.press(event->position().toPoint(), global, m_bounds)) {
        qCDebug(lcSurface) << "Ignoring press outside the ring";
    }
}

void RingLight::mouseMoveEvent(QMouseEvent *event) {
    if (!m_interaction.isActive()) {
        setCursor(RingInteraction::cursorFor(
            RingInteraction::hitTest(event->position().toPoint(), m_bounds.width())));
        return;
    }

    QRect next;
    if (!m_interaction.drag(Overlay::globalPos(event, m_origin), &next)) return;

    const bool resized = next.size() != m_bounds.size();
    m_bounds = next;
    Overlay::place(this, m_bounds, m_screen);
    if (resized) updateMask();
    update();
}

void RingLight::mouseReleaseEvent(QMouseEvent *event) {
    if (event->button() != Qt::LeftButton) return;
    if (!m_interaction.release()) return;

    qCDebug(lcSurface) << "Ring committed at" << m_bounds;
    if (m_observer) m_observer->ringGeometryCommitted(m_bounds);
}
