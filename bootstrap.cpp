#include "bootstrap.hpp"
#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

BootstrapResult runBootstrapChecks(int argc, char** argv) {
    (void)argc;
    (void)argv;

    BootstrapResult result;

    // ============================================================
    // Configs (buffered until the log file named in them is open)
    // ============================================================
    beginPhaseGroup();
    bool configValid = bootstrap_config::initAll();
    initLogger(g_settings.logFile);
    setLogLevel(parseLogLevel(g_settings.logLevel));
    endPhaseGroup();

    if (!configValid) {
        result.issues.push_back(ErrorManager::report("ERR_CONFIG_INVALID"));
    }
    LOG_PHASE("Configs initialized", true);

    LOG_DEBUG("Config", "size=" + std::to_string(g_settings.width) + "x" +
                        std::to_string(g_settings.height) +
                        " tick=" + std::to_string(g_settings.tickIntervalMs) + "ms" +
                        " stars=" + std::to_string(g_settings.starCount));

    // ============================================================
    // Fonts
    // ============================================================
    result.fontPath = findAnyFontInResources(g_settings.fontPath);
    if (!result.fontPath.empty()) {
        LOG_PHASE("Font search", true);
    } else {
        LOG_PHASE("Font search", false);
        result.issues.push_back(ErrorManager::report("ERR_FONT_MISSING"));
    }

    LOG_PHASE("Bootstrap complete", true);
    return result;
}
