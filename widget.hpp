#pragma once
#include <SFML/Graphics.hpp>
#include <array>
#include <string>

#include "action_result.hpp"
#include "background.hpp"
#include "bootstrap_config.hpp"
#include "star_field.hpp"
#include "stopwatch_core.hpp"
#include "time_format.hpp"
#include "timer.hpp"
#include "ui_anim.hpp"
#include "ui_config.hpp"
#include "ui_helpers.hpp"
#include "ui_layout.hpp"
#include "window_geometry.hpp"

// ============================================================
// Everything the widget needs between frames
// ============================================================
struct WidgetState {
    explicit WidgetState(const WidgetSettings& s);

    WidgetSettings settings;

    // Timing
    StopwatchCore core;
    RefreshTimer refresh;
    TimeText timeText;

    // Look
    BackgroundLayer background;
    StarField stars;
    sf::RenderTexture frame;
    bool controlsVisible = false;

    // Aspect lock (set while a background image is active)
    bool aspectLocked = false;
    float aspect = 2.f;

    // Pointer interaction
    enum class Mode { Idle, Dragging, Resizing, Sliding };
    Mode mode = Mode::Idle;
    WidgetPart hoverPart = WidgetPart::None;
    WidgetPart pressedPart = WidgetPart::None;
    ResizeEdges resizeEdges;
    sf::IntRect resizeStart;
    sf::Vector2i pressMouse;
    sf::Vector2i dragOffset;
    ClickTracker addClicks{kDoubleClickMs};
    sf::Clock clickClock;
    std::array<FadeAnim, 8> hover{};     // indexed by WidgetPart

    // Hover hint: how long the pointer has rested on hintPart
    WidgetPart hintPart = WidgetPart::None;
    float hintSeconds = 0.f;

    // Status line
    std::string statusText;
    sf::Color statusColor = sf::Color::White;
    float statusRemaining = 0.f;

    bool closeRequested = false;
};

// Hook the core's notifications to the refresh timer / time text
void connectCore(WidgetState& state);

// Re-format the time text from the core
void refreshTimeText(WidgetState& state);

// Per-frame housekeeping: refresh tick, animations, status timeout
void updateWidget(WidgetState& state, float dtSeconds);

// Window size changed: new frame texture, new stars. False if the texture failed.
bool resizeWidget(WidgetState& state, sf::Vector2u size);

// ------------------------------------------------------------
// User actions
// ------------------------------------------------------------
void toggleControls(WidgetState& state);

// "+" released at nowMs: a single click toggles the controls row; the second
// click of a double click leaves it alone and returns true (open the picker).
bool clickAddButton(WidgetState& state, long long nowMs);
void selectBackgroundImage(sf::RenderWindow& window, WidgetState& state);
void applyBackgroundImage(WidgetState& state, const std::string& path);
void resetBackground(WidgetState& state);
void setBackgroundAlpha(WidgetState& state, int alpha);

// Show a result in the status line (no-op for empty messages)
void flashStatus(WidgetState& state, const ActionResult& result);

// Hint for the hovered control once the pointer has rested long enough,
// nullptr otherwise (or while dragging/resizing/sliding)
const char* activeHint(const WidgetState& state);

// Copy geometry/background back into the settings for saving
void captureSettings(const sf::RenderWindow& window, WidgetState& state);
