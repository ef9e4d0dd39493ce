/*
 * SelfieLight - Persistent settings
 * License: MIT
 */

#include "settingsstore.h"
#include "logging.h"

#include <QStandardPaths>

SettingsStore::SettingsStore()
    : SettingsStore(defaultPath())
{
}

SettingsStore::SettingsStore(const QString &path)
    : m_settings(path, QSettings::IniFormat)
{
    qCDebug(lcSettings) << "Using settings file" << m_settings.fileName();
}

QString SettingsStore::defaultPath() {
    QString dir = QStandardPaths::writableLocation(QStandardPaths::ConfigLocation);
    return dir + QStringLiteral("/selfielight/config.ini");
}

int SettingsStore::load(const QString &key, int defaultValue) const {
    const QVariant v = m_settings.value(key);
    if (!v.isValid()) return defaultValue;

    bool ok = false;
    int result = v.toInt(&ok);
    if (!ok) {
        qCWarning(lcSettings, "Ignoring non-integer value for %s, using %d",
                  qPrintable(key), defaultValue);
        return defaultValue;
    }
    return result;
}

double SettingsStore::load(const QString &key, double defaultValue) const {
    const QVariant v = m_settings.value(key);
    if (!v.isValid()) return defaultValue;

    bool ok = false;
    double result = v.toDouble(&ok);
    if (!ok) {
        qCWarning(lcSettings, "Ignoring non-numeric value for %s, using %g",
                  qPrintable(key), defaultValue);
        return defaultValue;
    }
    return result;
}

QString SettingsStore::load(const QString &key, const QString &defaultValue) const {
    const QVariant v = m_settings.value(key);
    if (!v.isValid()) return defaultValue;

    if (!v.canConvert<QString>()) {
        qCWarning(lcSettings, "Ignoring non-string value for %s", qPrintable(key));
        return defaultValue;
    }
    return v.toString();
}

void SettingsStore::save(const QString &key, const QVariant &value) {
    m_settings.setValue(key, value);
    if (!sync()) {
        qCWarning(lcSettings, "Failed to save %s to %s",
                  qPrintable(key), qPrintable(m_settings.fileName()));
        return;
    }
    qCDebug(lcSettings) << "Saved" << key << "=" << value;
}

bool SettingsStore::contains(const QString &key) const {
    return m_settings.contains(key);
}

void SettingsStore::remove(const QString &key) {
    m_settings.remove(key);
    if (!sync()) {
        qCWarning(lcSettings, "Failed to remove %s", qPrintable(key));
    }
}

void SettingsStore::clear() {
    m_settings.clear();
    if (!sync()) {
        qCWarning(lcSettings, "Failed to clear %s", qPrintable(m_settings.fileName()));
    }
}

bool SettingsStore::sync() {
    m_settings.sync();
    return m_settings.status() == QSettings::NoError;
}
