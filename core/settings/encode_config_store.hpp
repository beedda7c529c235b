#pragma once

#include "encoder/encode_config.hpp"
#include "settings.hpp"

//! Reads a configuration snapshot; missing or malformed keys keep their defaults.
[[nodiscard]] EncodeConfig loadEncodeConfig(const Settings& settings);

void saveEncodeConfig(Settings& settings, const EncodeConfig& config);
