/*
 * SelfieLight - Overlay windows on X11 and Wayland
 *
 * On Wayland a client cannot place its own windows, so every light
 * surface becomes a layer-shell overlay anchored to the top-left corner
 * of its screen and positioned through the layer margins.
 * License: MIT
 */

#include "overlay.h"
#include "lightbar.h"
#include "logging.h"
#include "ringlight.h"

#include <QGuiApplication>
#include <QMargins>
#include <QMouseEvent>
#include <QScreen>
#include <QWindow>
#include <LayerShellQt/Window>

namespace Overlay {

bool usesLayerShell() {
    return QGuiApplication::platformName() == QLatin1String("wayland");
}

void prepare(QWindow *window, QScreen *screen) {
    window->setFlags(Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint |
                     Qt::Tool | Qt::NoDropShadowWindowHint);
    window->setScreen(screen);

    if (!usesLayerShell()) return;

    auto *layer = LayerShellQt::Window::get(window);
    if (!layer) {
        qCWarning(lcOverlay, "Failed to get LayerShellQt::Window, placement will be ignored");
        return;
    }

    layer->setLayer(LayerShellQt::Window::LayerOverlay);
    layer->setExclusiveZone(-1);
    layer->setScope(QStringLiteral("selfielight"));
    // Mouse only, never steal the keyboard from the video call
    layer->setKeyboardInteractivity(LayerShellQt::Window::KeyboardInteractivityNone);

    LayerShellQt::Window::Anchors anchors;
    anchors.setFlag(LayerShellQt::Window::AnchorTop);
    anchors.setFlag(LayerShellQt::Window::AnchorLeft);
    layer->setAnchors(anchors);
}

void place(QWindow *window, const QRect &bounds, QScreen *screen) {
    if (!usesLayerShell()) {
        window->setGeometry(bounds);
        return;
    }

    auto *layer = LayerShellQt::Window::get(window);
    if (layer) {
        const QPoint offset = bounds.topLeft() - screen->geometry().topLeft();
        layer->setMargins(QMargins(offset.x(), offset.y(), 0, 0));
    }
    window->resize(bounds.size());
}

QPoint globalPos(const QMouseEvent *event, const QPoint &origin) {
    // Layer surfaces do not know their position, derive it from our own
    if (usesLayerShell()) return origin + event->position().toPoint();
    return event->globalPosition().toPoint();
}

} // namespace Overlay

QRect ScreenWorkArea::rect() const {
    return m_screen->availableGeometry();
}

Surface *OverlayFactory::create(const SurfaceSpec &spec, SurfaceObserver *observer) {
    QWindow *window = nullptr;
    Surface *surface = nullptr;

    if (spec.role == Role::Ring) {
        auto *ring = new RingLight(spec.geometry, m_screen, observer);
        window = ring;
        surface = ring;
    } else {
        auto *bar = new LightBar(spec, m_screen, observer);
        window = bar;
        surface = bar;
    }

    window->show();
    if (!window->handle()) {
        qCWarning(lcOverlay) << "No platform window for" << roleName(spec.role) << "surface";
        delete window;
        return nullptr;
    }

    qCDebug(lcOverlay) << "Showing" << roleName(spec.role) << "surface at" << spec.geometry
                       << "on" << m_screen->name();
    return surface;
}
