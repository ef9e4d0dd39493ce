/*
 * SelfieLight - Light controller
 * License: MIT
 */

#include "controller.h"
#include "colormodel.h"
#include "logging.h"
#include "settingsstore.h"

Controller::Controller(SurfaceFactory &factory, SurfaceRegistry &registry,
                       SettingsStore &settings, const WorkArea &workArea,
                       QObject *parent)
    : QObject(parent)
    , m_factory(factory)
    , m_registry(registry)
    , m_settings(settings)
    , m_workArea(workArea.rect())
{
    loadSettings();
    m_color = ColorModel::colorFor(m_temperature, m_brightness);
}

void Controller::loadSettings() {
    m_temperature = qBound(ColorModel::MinTemperature,
                           m_settings.load(SettingsKey::ColorTemp, 4000),
                           ColorModel::MaxTemperature);
    m_brightness = qBound(ColorModel::MinBrightness,
                          m_settings.load(SettingsKey::Brightness, 1.0),
                          ColorModel::MaxBrightness);
    m_style = styleFromName(m_settings.load(SettingsKey::BarStyle, QStringLiteral("sides")));
    m_borderWidth = qMax(Layout::MinBarSize,
                         m_settings.load(SettingsKey::BorderWidth, Layout::DefaultBorderWidth));

    const int size = qMax(Layout::MinRingSize,
                          m_settings.load(SettingsKey::RingSize, Layout::DefaultRingSize));
    const QRect centered = Layout::centeredRing(m_workArea, size);
    m_ring = QRect(m_settings.load(SettingsKey::RingX, centered.x()),
                   m_settings.load(SettingsKey::RingY, centered.y()),
                   size, size);

    qCDebug(lcController) << "Loaded" << styleName(m_style) << m_temperature << "K"
                          << m_brightness << "border" << m_borderWidth << "ring" << m_ring;
}

void Controller::closeSurfaces() {
    for (Surface *s : m_surfaces) {
        m_registry.remove(s);
        s->close();
    }
    m_surfaces.clear();
}

void Controller::createBars() {
    closeSurfaces();

    const QList<SurfaceSpec> specs =
        Layout::surfacesFor(m_style, m_workArea, m_borderWidth, m_ring);
    for (const SurfaceSpec &spec : specs) {
        Surface *s = m_factory.create(spec, this);
        if (!s) {
            qCWarning(lcController, "Failed to create %s surface", qPrintable(roleName(spec.role)));
            continue;
        }
        m_registry.add(s);
        m_surfaces << s;
    }

    qCDebug(lcController) << "Created" << m_surfaces.size() << "surfaces for" << styleName(m_style);
    updateColors();
}

void Controller::setStyle(Style style) {
    m_style = style;
    m_settings.save(SettingsKey::BarStyle, styleName(style));
    createBars();
    emit styleChanged(style);
}

void Controller::setTemperature(int kelvin) {
    m_temperature = qBound(ColorModel::MinTemperature, kelvin, ColorModel::MaxTemperature);
    m_settings.save(SettingsKey::ColorTemp, m_temperature);
    updateColors();
}

void Controller::setBrightness(double factor) {
    m_brightness = qBound(ColorModel::MinBrightness, factor, ColorModel::MaxBrightness);
    m_settings.save(SettingsKey::Brightness, m_brightness);
    updateColors();
}

void Controller::updateColors() {
    m_color = ColorModel::colorFor(m_temperature, m_brightness);
    for (Surface *s : m_surfaces) {
        s->setColor(m_color);
    }
    emit colorChanged(m_color);
}

void Controller::resizeBorder(int thickness) {
    // Left and right must not overlap
    const int ceiling = qMax(Layout::MinBarSize,
                             qMin(m_workArea.width(), m_workArea.height()) / 2);
    m_borderWidth = qBound(Layout::MinBarSize, thickness, ceiling);
    m_settings.save(SettingsKey::BorderWidth, m_borderWidth);

    if (m_style == Style::Border) {
        createBars();
    }
}

void Controller::commitRingGeometry(const QRect &geometry) {
    const int size = qMax(Layout::MinRingSize, geometry.width());
    m_ring = QRect(geometry.x(), geometry.y(), size, size);
    m_settings.save(SettingsKey::RingSize, size);
    m_settings.save(SettingsKey::RingX, m_ring.x());
    m_settings.save(SettingsKey::RingY, m_ring.y());
}

void Controller::closeAll() {
    m_surfaces.clear();
    int closed = m_registry.closeAll();
    qCDebug(lcController) << "Closed" << closed << "surfaces";
    emit quitRequested();
}

void Controller::borderThicknessChanged(int thickness) {
    resizeBorder(thickness);
}

void Controller::ringGeometryCommitted(const QRect &geometry) {
    commitRingGeometry(geometry);
}

void Controller::contextMenuRequested(const QPoint &globalPos) {
    emit menuRequested(globalPos);
}
