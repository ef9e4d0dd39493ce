/*
 * SelfieLight - Temperature and brightness sliders
 * License: MIT
 */

#pragma once

#include <QDialog>

class Controller;
class QLabel;
class QSlider;

class AdjustmentDialog : public QDialog {
    Q_OBJECT
public:
    explicit AdjustmentDialog(Controller &controller, QWidget *parent = nullptr);

private:
    void onTemperatureChanged(int kelvin);
    void onBrightnessChanged(int percent);

    Controller &m_controller;
    QSlider *m_temperatureSlider = nullptr;
    QLabel *m_temperatureLabel = nullptr;
    QSlider *m_brightnessSlider = nullptr;
    QLabel *m_brightnessLabel = nullptr;
};
