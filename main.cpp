#include "pch.hpp"
#include "bootstrap.hpp"
#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "overlay_window.hpp"
#include "resources.hpp"
#include "ui_draw.hpp"
#include "ui_events.hpp"
#include "widget.hpp"

namespace fs = std::filesystem;

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    // Bootstrap configuration and resources (opens the log file)
    BootstrapResult boot = runBootstrapChecks(argc, argv);
    const WidgetSettings& settings = g_settings;

    // 🔹 Font (text is skipped without one, shapes still draw)
    sf::Font font;
    const sf::Font* fontPtr = nullptr;
    if (!boot.fontPath.empty()) {
        if (font.openFromFile(boot.fontPath)) {
            fontPtr = &font;
            LOG_DEBUG("Config", "Loaded font: " + boot.fontPath);
            LOG_PHASE("Font load", true);
        } else {
            LOG_ERROR("Config", "Could not load font: " + boot.fontPath);
            LOG_PHASE("Font load", false);
            boot.issues.push_back(ErrorManager::report("ERR_FONT_MISSING", boot.fontPath));
        }
    }

    // ============================================================
    // Window
    // ============================================================
    sf::RenderWindow window(sf::VideoMode({settings.width, settings.height}),
                            "NekoToki", sf::Style::None);
    window.setFramerateLimit(kFrameRateLimit);
    window.setKeyRepeatEnabled(false);

    const sf::VideoMode desktop = sf::VideoMode::getDesktopMode();
    window.setPosition(initialWindowPosition(desktop.size, window.getSize(),
                                             settings.posX, settings.posY));

    WidgetState state(settings);
    connectCore(state);

    if (!resizeWidget(state, window.getSize())) {
        LOG_PHASE("Frame texture", false);
        shutdownLogger();
        return 1;
    }
    LOG_PHASE("Window created", true);

    if (makeOverlayWindow(window)) {
        LOG_PHASE("Overlay window", true);
        LOG_DEBUG("Overlay", overlaySupportsAlpha() ? "Presenting with per-pixel alpha"
                                                    : "Presenting over an opaque backdrop");
    } else {
        LOG_PHASE("Overlay window", false);
        flashStatus(state, ErrorManager::report("ERR_OVERLAY_UNSUPPORTED"));
    }

    // Last background image + the alpha that was in use with it
    if (!settings.imagePath.empty()) {
        applyBackgroundImage(state, settings.imagePath);
        if (state.background.hasImage()) {
            setBackgroundAlpha(state, settings.alpha);
        }
    }

    for (const ActionResult& issue : boot.issues) {
        flashStatus(state, issue);
    }

    LOG_PHASE("Startup complete, entering main loop", true);

    // ============================================================
    // Frame loop
    // ============================================================
    sf::Clock frameClock;
    while (window.isOpen()) {
        if (!processEvents(window, state)) {
            break;
        }

        updateWidget(state, frameClock.restart().asSeconds());

        const WidgetLayout layout = computeLayout(sf::Vector2f(state.frame.getSize()),
                                                  state.controlsVisible);
        state.frame.clear(sf::Color::Transparent);
        drawUI(state.frame, fontPtr, state, layout);
        state.frame.display();

        presentFrame(window, state.frame.getTexture());
    }

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    stopRefresh(state.refresh);
    captureSettings(window, state);
    bootstrap_config::storeSettings(state.settings, g_widgetConfig);
    if (!bootstrap_config::saveConfig(fs::current_path() / CONFIG_FILE, g_widgetConfig)) {
        LOG_ERROR("Config", "Could not save " + std::string(CONFIG_FILE));
    }
    LOG_DEBUG("Stopwatch", "Final elapsed " + state.timeText.main + state.timeText.hundredths);

    window.close();
    LOG_PHASE("Shutdown complete", true);

    // 🔹 Close logger
    shutdownLogger();
    return 0;
}
