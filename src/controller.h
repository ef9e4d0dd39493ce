/*
 * SelfieLight - Light controller
 *
 * Owns the current style and color and the set of surfaces showing them.
 * License: MIT
 */

#pragma once

#include "layout.h"
#include "surface.h"

#include <QColor>
#include <QList>
#include <QObject>
#include <QRect>

class SettingsStore;

class Controller : public QObject, public SurfaceObserver {
    Q_OBJECT
public:
    Controller(SurfaceFactory &factory, SurfaceRegistry &registry,
               SettingsStore &settings, const WorkArea &workArea,
               QObject *parent = nullptr);

    Style style() const { return m_style; }
    int temperature() const { return m_temperature; }
    double brightness() const { return m_brightness; }
    int borderWidth() const { return m_borderWidth; }
    QRect ringGeometry() const { return m_ring; }
    QColor color() const { return m_color; }
    QList<Surface *> surfaces() const { return m_surfaces; }

    // SurfaceObserver
    void borderThicknessChanged(int thickness) override;
    void ringGeometryCommitted(const QRect &geometry) override;
    void contextMenuRequested(const QPoint &globalPos) override;

public slots:
    void createBars();
    void setStyle(Style style);
    void setTemperature(int kelvin);
    void setBrightness(double factor);
    void updateColors();
    void resizeBorder(int thickness);
    void commitRingGeometry(const QRect &geometry);
    void closeAll();

signals:
    void styleChanged(Style style);
    void colorChanged(const QColor &color);
    void menuRequested(const QPoint &globalPos);
    void quitRequested();

private:
    void loadSettings();
    void closeSurfaces();

    SurfaceFactory &m_factory;
    SurfaceRegistry &m_registry;
    SettingsStore &m_settings;
    QRect m_workArea;

    Style m_style = Style::Sides;
    int m_temperature = 4000;
    double m_brightness = 1.0;
    int m_borderWidth = Layout::DefaultBorderWidth;
    QRect m_ring;
    QColor m_color;
    QList<Surface *> m_surfaces;
};
