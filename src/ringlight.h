/*
 * SelfieLight - Circular ring light window
 * License: MIT
 */

#pragma once

#include "ringinteraction.h"
#include "surface.h"

#include <QColor>
#include <QRasterWindow>

class QScreen;

class RingLight : public QRasterWindow, public Surface {
public:
    RingLight(const QRect &bounds, QScreen *screen, SurfaceObserver *observer);

    Role role() const override { return Role::Ring; }
    QRect bounds() const override { return m_bounds; }
    QColor color() const override { return m_color; }
    void setColor(const QColor &color) override;
    bool isClosed() const override { return m_closed; }
    void close() override;

protected:
    void paintEvent(QPaintEvent *) override;
    void resizeEvent(QResizeEvent *) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;

private:
    void updateMask();

    QRect m_bounds;
    QPoint m_origin;
    QColor m_color = Qt::white;
    QScreen *m_screen;
    SurfaceObserver *m_observer;
    RingInteraction m_interaction;
    bool m_closed = false;
};
