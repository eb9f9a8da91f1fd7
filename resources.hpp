#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "bootstrap_config.hpp"

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* CONFIG_FILE = "nekotoki_config.json";
inline constexpr const char* ERRORS_FILE = "errors.json";

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------
// Returns the full path to the resources folder
// - In portable mode (NEKOTOKI_PORTABLE_ONLY), points to ./resources next to exe
// - Otherwise prefers <project>/resources, then <build>/resources, then cwd
std::string getResourcePath();

// Locate a usable font: `preferred` if it exists, else the first .ttf/.otf in
// resources/, else a known system font. Empty string if nothing was found.
std::string findAnyFontInResources(const std::string& preferred = "");

// ------------------------------------------------------------
// Global widget config (raw JSON + typed view)
// ------------------------------------------------------------
extern nlohmann::json g_widgetConfig;
extern WidgetSettings g_settings;
