/*
 * SelfieLight - Rectangular light bar window
 * License: MIT
 */

#pragma once

#include "barinteraction.h"
#include "surface.h"

#include <QColor>
#include <QRasterWindow>

class QScreen;

class LightBar : public QRasterWindow, public Surface {
public:
    LightBar(const SurfaceSpec &spec, QScreen *screen, SurfaceObserver *observer);

    Role role() const override { return m_role; }
    QRect bounds() const override { return m_bounds; }
    QColor color() const override { return m_color; }
    void setColor(const QColor &color) override;
    bool isClosed() const override { return m_closed; }
    void close() override;

protected:
    void paintEvent(QPaintEvent *) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;

private:
    Role m_role;
    QRect m_bounds;
    QPoint m_origin;
    QColor m_color = Qt::white;
    QScreen *m_screen;
    SurfaceObserver *m_observer;
    BarInteraction m_interaction;
    bool m_closed = false;
};
