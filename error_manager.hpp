#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Undefine Windows ERROR macro if it leaks in
#ifdef ERROR
#undef ERROR
#endif

#include "action_result.hpp"

// ------------------------------------------------------------
// ErrorManager
// Catalogue of error codes -> { "user": ..., "debug": ... }
// ------------------------------------------------------------
namespace ErrorManager {
    // Load error codes from JSON (errors.json); returns false if unreadable
    bool load(const std::string& path);

    // Replace the catalogue directly (accepts {"errors": {...}} or a bare map)
    void setCatalogue(const nlohmann::json& catalogue);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Report an error: logs the debug text, returns a failed ActionResult
    ActionResult report(const std::string& code);

    // Same, with extra context appended to the debug log line
    ActionResult report(const std::string& code, const std::string& detail);

    // Internal storage
    extern nlohmann::json root;
}
