#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "timer.hpp"
#include "logger.hpp"

#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

// ----------------- helpers -----------------
template <typename T>
static T readOr(const nlohmann::json& cfg, const char* section, const char* key, T fallback) {
    if (!cfg.is_object() || !cfg.contains(section) || !cfg.at(section).is_object()) {
        return fallback;
    }
    const auto& sec = cfg.at(section);
    if (!sec.contains(key)) {
        return fallback;
    }
    try {
        return sec.at(key).get<T>();
    } catch (const nlohmann::json::type_error&) {
        return fallback;
    }
}

static long clampLong(long v, long lo, long hi) {
    return std::clamp(v, lo, hi);
}

namespace bootstrap_config {

bool mergeDefaults(nlohmann::json& cfg,
                   const nlohmann::json& defs,
                   int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, patchedCount))
                patched = true;
        } else if (defVal.is_number() && cfg[key].is_number()) {
            // int vs float spelling of a number is fine
            continue;
        } else if (cfg[key].type() != defVal.type()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

// ----------------- defaults -----------------
nlohmann::json defaultSettings() {
    return {
        {"window", {
            {"width", 200},
            {"height", 100},
            {"x", -1},
            {"y", -1},
            {"min_width", 150},
            {"min_height", 80},
            {"border_margin", 5}
        }},
        {"timer", {
            {"tick_interval_ms", 50}
        }},
        {"background", {
            {"image_path", ""},
            {"alpha", 120},
            {"image_alpha", 150}
        }},
        {"stars", {
            {"count", 50},
            {"twinkle", true}
        }},
        {"font", {
            {"path", ""}
        }},
        {"log", {
            {"file", "nekotoki.log"},
            {"level", "debug"}
        }}
    };
}

nlohmann::json defaultErrors() {
    return {
        {"ERR_BG_LOAD_FAILED", {
            {"user", "Could not load that image."},
            {"debug", "sf::Texture::loadFromFile failed for the selected background."}
        }},
        {"ERR_PICKER_UNAVAILABLE", {
            {"user", "No file picker available."},
            {"debug", "Native open-file dialog could not be shown (zenity/osascript/comdlg32)."}
        }},
        {"ERR_FONT_MISSING", {
            {"user", "No font found."},
            {"debug", "No .ttf/.otf in resources/ and no known system font present."}
        }},
        {"ERR_CONFIG_INVALID", {
            {"user", "Settings were invalid and have been reset."},
            {"debug", "nekotoki_config.json failed parsing; defaults written back."}
        }},
        {"ERR_OVERLAY_UNSUPPORTED", {
            {"user", "Always-on-top is not available here."},
            {"debug", "Platform overlay setup failed or is not implemented for this platform."}
        }}
    };
}

// ----------------- typed settings -----------------
WidgetSettings settingsFromJson(const nlohmann::json& cfg) {
    WidgetSettings s;

    s.width        = static_cast<unsigned>(clampLong(readOr<long>(cfg, "window", "width", 200), 50, 4096));
    s.height       = static_cast<unsigned>(clampLong(readOr<long>(cfg, "window", "height", 100), 30, 4096));
    s.posX         = static_cast<int>(readOr<long>(cfg, "window", "x", -1));
    s.posY         = static_cast<int>(readOr<long>(cfg, "window", "y", -1));
    s.minWidth     = static_cast<unsigned>(clampLong(readOr<long>(cfg, "window", "min_width", 150), 50, 4096));
    s.minHeight    = static_cast<unsigned>(clampLong(readOr<long>(cfg, "window", "min_height", 80), 30, 4096));
    s.borderMargin = static_cast<int>(clampLong(readOr<long>(cfg, "window", "border_margin", 5), 1, 32));

    s.width  = std::max(s.width, s.minWidth);
    s.height = std::max(s.height, s.minHeight);

    s.tickIntervalMs = clampTickInterval(readOr<long>(cfg, "timer", "tick_interval_ms", 50)).count();

    s.imagePath  = readOr<std::string>(cfg, "background", "image_path", "");
    s.alpha      = static_cast<int>(clampLong(readOr<long>(cfg, "background", "alpha", 120), 0, 255));
    s.imageAlpha = static_cast<int>(clampLong(readOr<long>(cfg, "background", "image_alpha", 150), 0, 255));

    s.starCount = static_cast<unsigned>(clampLong(readOr<long>(cfg, "stars", "count", 50), 0, 2000));
    s.twinkle   = readOr<bool>(cfg, "stars", "twinkle", true);

    s.fontPath = readOr<std::string>(cfg, "font", "path", "");

    s.logFile  = readOr<std::string>(cfg, "log", "file", "nekotoki.log");
    s.logLevel = readOr<std::string>(cfg, "log", "level", "debug");

    return s;
}

void storeSettings(const WidgetSettings& s, nlohmann::json& cfg) {
    cfg["window"]["width"]  = s.width;
    cfg["window"]["height"] = s.height;
    cfg["window"]["x"]      = s.posX;
    cfg["window"]["y"]      = s.posY;
    cfg["background"]["image_path"] = s.imagePath;
    cfg["background"]["alpha"]      = s.alpha;
}

// ----------------- loader -----------------
bool saveConfig(const fs::path& path, const nlohmann::json& cfg) {
    std::ofstream out(path);
    if (!out) {
        LOG_ERROR("Config", "Could not write " + path.string());
        return false;
    }
    out << cfg.dump(2) << "\n";
    return static_cast<bool>(out);
}

bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        saveConfig(path, outConfig);

        LOG_PHASE(name + " created", true);
        return true;
    }

    auto resetToDefaults = [&](const std::string& reason) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + reason + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode);

        outConfig = defaults;
        saveConfig(path, outConfig);
        return false;
    };

    try {
        std::ifstream f(path);
        f >> outConfig;
    } catch (const nlohmann::json::exception& e) {
        return resetToDefaults(e.what());
    }

    if (!outConfig.is_object()) {
        return resetToDefaults("top-level value is not an object");
    }

    int patchedCount = 0;
    if (mergeDefaults(outConfig, defaults, &patchedCount)) {
        saveConfig(path, outConfig);
        LOG_PHASE(name + " patched", true);
        LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
    } else {
        LOG_PHASE(name + " load", true);
    }
    return true;
}

// ----------------- entry -----------------
bool initAll() {
    // errors.json first so later loaders can report through it
    fs::path errPath = fs::path(getResourcePath()) / ERRORS_FILE;
    nlohmann::json errorsCfg;
    loadConfig(errPath, defaultErrors(), errorsCfg, "Errors config", "");
    ErrorManager::setCatalogue(errorsCfg);

    // nekotoki_config.json
    fs::path cfgPath = fs::current_path() / CONFIG_FILE;
    bool valid = loadConfig(cfgPath, defaultSettings(), g_widgetConfig, "Widget config");
    g_settings = settingsFromJson(g_widgetConfig);
    return valid;
}

} // namespace bootstrap_config
