/*
 * SelfieLight - Overlay windows on X11 and Wayland
 * License: MIT
 */

#pragma once

#include "surface.h"

#include <QPoint>
#include <QRect>

class QMouseEvent;
class QScreen;
class QWindow;

namespace Overlay {

// True on the wayland platform, where surfaces are wlr-layer-shell
// overlays positioned through margins instead of window geometry.
bool usesLayerShell();

// Must run before the window is shown
void prepare(QWindow *window, QScreen *screen);
void place(QWindow *window, const QRect &bounds, QScreen *screen);

// Cursor position in screen coordinates. origin is where the window's
// last committed frame sits, which on layer shell can lag behind the
// bounds passed to place().
QPoint globalPos(const QMouseEvent *event, const QPoint &origin);

} // namespace Overlay

class ScreenWorkArea : public WorkArea {
public:
    explicit ScreenWorkArea(QScreen *screen) : m_screen(screen) {}
    QRect rect() const override;

private:
    QScreen *m_screen;
};

class OverlayFactory : public SurfaceFactory {
public:
    explicit OverlayFactory(QScreen *screen) : m_screen(screen) {}
    Surface *create(const SurfaceSpec &spec, SurfaceObserver *observer) override;

private:
    QScreen *m_screen;
};
