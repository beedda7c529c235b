#pragma once

#include "settings.hpp"

#include <memory>

class QSettings;
class QString;

//!
//! \brief Settings stored in an INI file, falling back to a read-only defaults file for missing keys.
//!
class IniSettings final : public Settings
{
public:
    explicit IniSettings(const QString& fileName, const QString& defaultFileName = "");
    ~IniSettings() override;

    [[nodiscard]] QVariant get(const QString& key) const override;
    void Set(const QString& key, const QVariant& value) override;
    void sync() override;

    [[nodiscard]] QString fileName() const override;

private:
    std::unique_ptr<QSettings> settings;
    std::unique_ptr<QSettings> defaultSettings;
};
