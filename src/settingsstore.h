/*
 * SelfieLight - Persistent settings
 * License: MIT
 */

#pragma once

#include <QSettings>
#include <QString>
#include <QVariant>

namespace SettingsKey {
constexpr const char *ColorTemp = "ColorTemp";
constexpr const char *Brightness = "Brightness";
constexpr const char *BarStyle = "BarStyle";
constexpr const char *BorderWidth = "BorderWidth";
constexpr const char *RingSize = "RingSize";
constexpr const char *RingX = "RingX";
constexpr const char *RingY = "RingY";
} // namespace SettingsKey

/*
 * Flat key-value settings in an INI file. Reads never fail: a missing
 * key or a value that does not convert to the default's type yields the
 * default. Writes never throw, failures are only logged.
 */
class SettingsStore {
public:
    // <config dir>/selfielight/config.ini
    SettingsStore();
    explicit SettingsStore(const QString &path);

    SettingsStore(const SettingsStore &) = delete;
    SettingsStore &operator=(const SettingsStore &) = delete;

    static QString defaultPath();

    QString path() const { return m_settings.fileName(); }

    int load(const QString &key, int defaultValue) const;
    double load(const QString &key, double defaultValue) const;
    QString load(const QString &key, const QString &defaultValue) const;

    void save(const QString &key, const QVariant &value);

    bool contains(const QString &key) const;
    void remove(const QString &key);
    void clear();

private:
    bool sync();

    mutable QSettings m_settings;
};
