/*
 * SelfieLight - Light surface interfaces
 *
 * The controller only talks to these interfaces, the Qt windows live in
 * lightbar.cpp and ringlight.cpp and are created by the overlay factory.
 * License: MIT
 */

#pragma once

#include "layout.h"

#include <QColor>
#include <QList>
#include <QPoint>
#include <QRect>

class Surface {
public:
    virtual ~Surface() = default;

    virtual Role role() const = 0;
    virtual QRect bounds() const = 0;
    virtual QColor color() const = 0;
    virtual void setColor(const QColor &color) = 0;
    virtual bool isClosed() const = 0;
    // Hides the surface and releases it. Closing twice is a no-op.
    virtual void close() = 0;
};

// Notifications from a surface back to whoever placed it
class SurfaceObserver {
public:
    virtual ~SurfaceObserver() = default;

    virtual void borderThicknessChanged(int thickness) = 0;
    virtual void ringGeometryCommitted(const QRect &geometry) = 0;
    virtual void contextMenuRequested(const QPoint &globalPos) = 0;
};

class SurfaceFactory {
public:
    virtual ~SurfaceFactory() = default;

    // Returns a visible surface, ownership stays with the surface itself
    // and ends with close().
    virtual Surface *create(const SurfaceSpec &spec, SurfaceObserver *observer) = 0;
};

class WorkArea {
public:
    virtual ~WorkArea() = default;

    virtual QRect rect() const = 0;
};

/*
 * Every surface created and not yet closed, across all styles. Owned by
 * the application and handed to the controller.
 */
class SurfaceRegistry {
public:
    void add(Surface *surface);
    void remove(Surface *surface);
    bool contains(Surface *surface) const { return m_surfaces.contains(surface); }
    QList<Surface *> surfaces() const { return m_surfaces; }
    int size() const { return m_surfaces.size(); }

    // Closes every tracked surface and forgets them. Returns the number
    // of surfaces actually closed.
    int closeAll();

private:
    QList<Surface *> m_surfaces;
};
