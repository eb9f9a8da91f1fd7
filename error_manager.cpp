#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>
#include <filesystem>

// ------------------------------------------------------------
// ErrorManager implementation
// ------------------------------------------------------------
nlohmann::json ErrorManager::root = nlohmann::json::object();

void ErrorManager::setCatalogue(const nlohmann::json& catalogue) {
    if (catalogue.contains("errors") && catalogue["errors"].is_object()) {
        root = catalogue["errors"];
    } else if (catalogue.is_object()) {
        root = catalogue;
    } else {
        root = nlohmann::json::object();
    }
}

bool ErrorManager::load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return false;
    }

    try {
        nlohmann::json parsed;
        in >> parsed;
        setCatalogue(parsed);

        std::string codes;
        for (auto& [key, val] : root.items()) {
            (void)val;
            codes += key + " ";
        }
        LOG_DEBUG("ErrorManager", "Loaded " + fs::absolute(path).string());
        LOG_TRACE("ErrorManager", "Available error codes: " + codes);
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path + " -> " + e.what());
        return false;
    }
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    if (root.contains(code) && root[code].contains("user") && root[code]["user"].is_string()) {
        return root[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    if (root.contains(code) && root[code].contains("debug") && root[code]["debug"].is_string()) {
        return root[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

ActionResult ErrorManager::report(const std::string& code) {
    return report(code, "");
}

ActionResult ErrorManager::report(const std::string& code, const std::string& detail) {
    std::string debugMsg = getDebugMessage(code);
    if (!detail.empty()) {
        debugMsg += " (" + detail + ")";
    }

    ActionResult result;
    result.success   = false;
    result.message   = getUserMessage(code);
    result.color     = sf::Color(220, 150, 150);
    result.errorCode = code;

    LOG_ERROR("ErrorManager", code + " -> " + debugMsg);
    return result;
}
