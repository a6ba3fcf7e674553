#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "io/Settings.hpp"
#include "resume/Style.hpp"

// Style file: every key optional, unknown keys ignored, wrong types throw.
resume::StyleConfig loadStyleConfig(const std::string& path);
void applyStyleOverrides(const nlohmann::json& j, resume::StyleConfig& style);

// Settings file, same rules.
Settings loadSettings(const std::string& path);
void applySettingsOverrides(const nlohmann::json& j, Settings& settings);

// N8N_WEBHOOK_URL, TIMEOUT_SECONDS, MAX_FILE_SIZE_MB
void applySettingsEnvironment(Settings& settings);
