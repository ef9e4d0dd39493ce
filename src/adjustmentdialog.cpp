/*
 * SelfieLight - Temperature and brightness sliders
 *
 * Every slider step is applied and saved right away so the light follows
 * the slider while it is dragged.
 * License: MIT
 */

#include "adjustmentdialog.h"
#include "colormodel.h"
#include "controller.h"

#include <QDialogButtonBox>
#include <QGridLayout>
#include <QLabel>
#include <QSlider>
#include <QVBoxLayout>

AdjustmentDialog::AdjustmentDialog(Controller &controller, QWidget *parent)
    : QDialog(parent), m_controller(controller)
{
    setWindowTitle(tr("Adjust Light"));
    setWindowFlag(Qt::WindowStaysOnTopHint);
    setMinimumWidth(360);

    auto *layout = new QVBoxLayout(this);
    auto *grid = new QGridLayout();

    grid->addWidget(new QLabel(tr("Temperature:")), 0, 0);
    m_temperatureSlider = new QSlider(Qt::Horizontal);
    m_temperatureSlider->setRange(ColorModel::MinTemperature, ColorModel::MaxTemperature);
    m_temperatureSlider->setSingleStep(100);
    m_temperatureSlider->setPageStep(500);
    m_temperatureSlider->setValue(m_controller.temperature());
    m_temperatureLabel = new QLabel(QString("%1 K").arg(m_controller.temperature()));
    m_temperatureLabel->setFixedWidth(60);
    grid->addWidget(m_temperatureSlider, 0, 1);
    grid->addWidget(m_temperatureLabel, 0, 2);

    grid->addWidget(new QLabel(tr("Brightness:")), 1, 0);
    m_brightnessSlider = new QSlider(Qt::Horizontal);
    m_brightnessSlider->setRange(qRound(ColorModel::MinBrightness * 100),
                                 qRound(ColorModel::MaxBrightness * 100));
    m_brightnessSlider->setValue(qRound(m_controller.brightness() * 100));
    m_brightnessLabel = new QLabel(QString("%1%").arg(m_brightnessSlider->value()));
    m_brightnessLabel->setFixedWidth(60);
    grid->addWidget(m_brightnessSlider, 1, 1);
    grid->addWidget(m_brightnessLabel, 1, 2);

    layout->addLayout(grid);

    auto *buttons = new QDialogButtonBox(QDialogButtonBox::Close);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::accept);
    layout->addWidget(buttons);

    connect(m_temperatureSlider, &QSlider::valueChanged, this, &AdjustmentDialog::onTemperatureChanged);
    connect(m_brightnessSlider, &QSlider::valueChanged, this, &AdjustmentDialog::onBrightnessChanged);
}

void AdjustmentDialog::onTemperatureChanged(int kelvin) {
    m_temperatureLabel->setText(QString("%1 K").arg(kelvin));
    m_controller.setTemperature(kelvin);
}

void AdjustmentDialog::onBrightnessChanged(int percent) {
    m_brightnessLabel->setText(QString("%1%").arg(percent));
    m_controller.setBrightness(percent / 100.0);
}
