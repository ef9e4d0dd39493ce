/*
 * SelfieLight - Color temperature model
 * License: MIT
 */

#pragma once

#include <QColor>

namespace ColorModel {

constexpr int MinTemperature = 2700;
constexpr int MaxTemperature = 6500;
constexpr double MinBrightness = 0.1;
constexpr double MaxBrightness = 1.0;

// Approximation of the Planckian locus, valid for roughly 1000K-40000K.
QColor kelvinToRgb(int kelvin);

// Scales every channel by factor, clamped to [0,255] and truncated.
QColor adjustBrightness(const QColor &color, double factor);

QColor colorFor(int kelvin, double brightness);

} // namespace ColorModel
