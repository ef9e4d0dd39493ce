/*
 * SelfieLight - Bar styles and the geometry of each style
 * License: MIT
 */

#pragma once

#include <QList>
#include <QRect>
#include <QString>

enum class Style { Sides, Border, Top, Fullscreen, Ring };

enum class Role { Generic, Left, Right, Border, Top, Fullscreen, Ring };

QString styleName(Style style);
// Returns false and leaves style untouched for unknown names.
bool parseStyle(const QString &name, Style *style);
Style styleFromName(const QString &name);

QString roleName(Role role);

struct SurfaceSpec {
    Role role = Role::Generic;
    QRect geometry;
};

namespace Layout {

constexpr double SideBarFraction = 0.15;
constexpr double TopBarFraction = 0.15;
constexpr int MinBarSize = 20;
constexpr int MinRingSize = 100;
constexpr int DefaultRingSize = 400;
constexpr int DefaultBorderWidth = 100;

QRect centeredRing(const QRect &workArea, int size);

QList<SurfaceSpec> surfacesFor(Style style, const QRect &workArea,
                               int borderWidth, const QRect &ring);

} // namespace Layout
