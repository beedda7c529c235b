#include "ini_settings.hpp"

#include "utils/logging.hpp"

#include <QFile>
#include <QSettings>

IniSettings::IniSettings(const QString& fileName, const QString& defaultFileName)
    : settings(std::make_unique<QSettings>(fileName, QSettings::IniFormat))
{
    if (!defaultFileName.isEmpty() && QFile::exists(defaultFileName))
        defaultSettings = std::make_unique<QSettings>(defaultFileName, QSettings::IniFormat);
    else if (!defaultFileName.isEmpty())
        qCWarning(lcConfig) << "Default configuration" << defaultFileName << "not found";
}

IniSettings::~IniSettings() = default;

QVariant IniSettings::get(const QString& key) const
{
    if (settings->contains(key))
        return settings->value(key);

    if (defaultSettings && defaultSettings->contains(key))
        return defaultSettings->value(key);

    return {};
}

void IniSettings::Set(const QString& key, const QVariant& value)
{
    settings->setValue(key, value);
}

void IniSettings::sync()
{
    settings->sync();

    if (settings->status() != QSettings::NoError)
        qCWarning(lcConfig) << "Could not write configuration to" << settings->fileName();
}

QString IniSettings::fileName() const
{
    return settings->fileName();
}
