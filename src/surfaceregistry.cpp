/*
 * SelfieLight - Registry of open light surfaces
 * License: MIT
 */

#include "surface.h"
#include "logging.h"

void SurfaceRegistry::add(Surface *surface) {
    if (surface && !m_surfaces.contains(surface)) m_surfaces.append(surface);
}

void SurfaceRegistry::remove(Surface *surface) {
    m_surfaces.removeAll(surface);
}

int SurfaceRegistry::closeAll() {
    const QList<Surface *> surfaces = m_surfaces;
    m_surfaces.clear();

    int closed = 0;
    for (Surface *s : surfaces) {
        if (s->isClosed()) {
            qCDebug(lcSurface) << "Skipping already closed" << roleName(s->role()) << "surface";
            continue;
        }
        s->close();
        ++closed;
    }
    return closed;
}
