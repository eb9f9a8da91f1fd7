#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

// ------------------------------------------------------------
// Typed view of nekotoki_config.json (values clamped on read)
// ------------------------------------------------------------
struct WidgetSettings {
    unsigned width = 200;
    unsigned height = 100;
    int posX = -1;              // -1 = place top-right of desktop
    int posY = -1;
    unsigned minWidth = 150;
    unsigned minHeight = 80;
    int borderMargin = 5;

    long tickIntervalMs = 50;

    std::string imagePath;
    int alpha = 120;            // plain background alpha
    int imageAlpha = 150;       // alpha applied when an image is chosen

    unsigned starCount = 50;
    bool twinkle = true;

    std::string fontPath;

    std::string logFile = "nekotoki.log";
    std::string logLevel = "debug";
};

// Centralized config bootstrap for NekoToki
namespace bootstrap_config {

    // Load config + error catalogue, fill g_widgetConfig / ErrorManager.
    // Returns false if the widget config was invalid and got reset.
    bool initAll();

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Recursively add missing / mistyped keys from defs; returns true if cfg changed
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defs,
                       int* patchedCount = nullptr);

    // Canonical defaults
    nlohmann::json defaultSettings();
    nlohmann::json defaultErrors();

    // JSON <-> typed settings
    WidgetSettings settingsFromJson(const nlohmann::json& cfg);
    void storeSettings(const WidgetSettings& s, nlohmann::json& cfg);

    // Write cfg to path (pretty-printed); false on I/O failure
    bool saveConfig(const std::filesystem::path& path, const nlohmann::json& cfg);
}
