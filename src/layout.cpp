/*
 * SelfieLight - Bar styles and the geometry of each style
 * License: MIT
 */

#include "layout.h"

QString styleName(Style style) {
    switch (style) {
    case Style::Sides: return QStringLiteral("sides");
    case Style::Border: return QStringLiteral("border");
    case Style::Top: return QStringLiteral("top");
    case Style::Fullscreen: return QStringLiteral("fullscreen");
    case Style::Ring: return QStringLiteral("ring");
    }
    return QStringLiteral("sides");
}

bool parseStyle(const QString &name, Style *style) {
    const QString n = name.trimmed().toLower();
    for (Style s : {Style::Sides, Style::Border, Style::Top, Style::Fullscreen, Style::Ring}) {
        if (styleName(s) == n) {
            *style = s;
            return true;
        }
    }
    return false;
}

Style styleFromName(const QString &name) {
    Style style = Style::Sides;
    parseStyle(name, &style);
    return style;
}

QString roleName(Role role) {
    switch (role) {
    case Role::Generic: return QStringLiteral("generic");
    case Role::Left: return QStringLiteral("left");
    case Role::Right: return QStringLiteral("right");
    case Role::Border: return QStringLiteral("border");
    case Role::Top: return QStringLiteral("top");
    case Role::Fullscreen: return QStringLiteral("fullscreen");
    case Role::Ring: return QStringLiteral("ring");
    }
    return QStringLiteral("generic");
}

namespace Layout {

QRect centeredRing(const QRect &workArea, int size) {
    return QRect(workArea.x() + (workArea.width() - size) / 2,
                 workArea.y() + (workArea.height() - size) / 2,
                 size, size);
}

QList<SurfaceSpec> surfacesFor(Style style, const QRect &workArea,
                               int borderWidth, const QRect &ring) {
    const int x = workArea.x();
    const int y = workArea.y();
    const int w = workArea.width();
    const int h = workArea.height();

    QList<SurfaceSpec> specs;
    switch (style) {
    case Style::Sides: {
        const int barWidth = static_cast<int>(w * SideBarFraction);
        specs << SurfaceSpec{Role::Left, QRect(x, y, barWidth, h)};
        specs << SurfaceSpec{Role::Right, QRect(x + w - barWidth, y, barWidth, h)};
        break;
    }
    case Style::Border: {
        const int t = qMax(MinBarSize, borderWidth);
        // Top and bottom span the full width, left and right the full height
        specs << SurfaceSpec{Role::Border, QRect(x, y, w, t)};
        specs << SurfaceSpec{Role::Border, QRect(x, y + h - t, w, t)};
        specs << SurfaceSpec{Role::Border, QRect(x, y, t, h)};
        specs << SurfaceSpec{Role::Border, QRect(x + w - t, y, t, h)};
        break;
    }
    case Style::Top:
        specs << SurfaceSpec{Role::Top, QRect(x, y, w, static_cast<int>(h * TopBarFraction))};
        break;
    case Style::Fullscreen:
        specs << SurfaceSpec{Role::Fullscreen, workArea};
        break;
    case Style::Ring: {
        const int size = qMax(MinRingSize, ring.width());
        specs << SurfaceSpec{Role::Ring, QRect(ring.x(), ring.y(), size, size)};
        break;
    }
    }
    return specs;
}

} // namespace Layout
