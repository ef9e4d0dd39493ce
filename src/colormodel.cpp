/*
 * SelfieLight - Color temperature model
 * License: MIT
 */

#include "colormodel.h"

#include <QtGlobal>
#include <cmath>

namespace {

int toChannel(double value) {
    return static_cast<int>(qBound(0.0, value, 255.0));
}

} // namespace

namespace ColorModel {

QColor kelvinToRgb(int kelvin) {
    const double t = kelvin / 100.0;

    double r, g, b;
    if (t <= 66.0) {
        r = 255.0;
        g = 99.4708025861 * std::log(t) - 161.1195681661;
    } else {
        r = 329.698727446 * std::pow(t - 60.0, -0.1332047592);
        g = 288.1221695283 * std::pow(t - 60.0, -0.0755148492);
    }

    if (t >= 66.0) {
        b = 255.0;
    } else if (t <= 19.0) {
        b = 0.0;
    } else {
        b = 138.5177312231 * std::log(t - 10.0) - 305.0447927307;
    }

    return QColor(toChannel(r), toChannel(g), toChannel(b));
}

QColor adjustBrightness(const QColor &color, double factor) {
    return QColor(toChannel(color.red() * factor),
                  toChannel(color.green() * factor),
                  toChannel(color.blue() * factor));
}

QColor colorFor(int kelvin, double brightness) {
    return adjustBrightness(kelvinToRgb(kelvin), brightness);
}

} // namespace ColorModel
