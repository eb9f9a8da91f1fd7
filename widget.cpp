#include "widget.hpp"
#include "error_manager.hpp"
#include "overlay_window.hpp"
#include "logger.hpp"

WidgetState::WidgetState(const WidgetSettings& s)
    : settings(s),
      background(kDefaultBackgroundAlpha, s.imageAlpha),
      stars(s.starCount) {
    background.setAlpha(s.alpha);
    refresh.interval = clampTickInterval(s.tickIntervalMs);
    aspect = static_cast<float>(s.width) / static_cast<float>(s.height);
    stars.setTwinkle(s.twinkle);
    timeText = formatElapsed(std::chrono::nanoseconds::zero());
}

// ============================================================
// Core wiring
// ============================================================
void connectCore(WidgetState& state) {
    state.core.subscribe([&state](StopwatchCore::State s) {
        if (s == StopwatchCore::State::Running) {
            startRefresh(state.refresh, std::chrono::steady_clock::now());
        } else {
            stopRefresh(state.refresh);
        }
        refreshTimeText(state);
        LOG_TRACE("Stopwatch", std::string("State -> ") + toString(s) +
                               " at " + state.timeText.main + state.timeText.hundredths);
    });
}

void refreshTimeText(WidgetState& state) {
    state.timeText = formatElapsed(state.core.elapsed());
}

void updateWidget(WidgetState& state, float dtSeconds) {
    if (checkRefreshExpired(state.refresh, std::chrono::steady_clock::now())) {
        refreshTimeText(state);
    }

    state.stars.update(dtSeconds);

    if (state.hoverPart != state.hintPart) {
        state.hintPart = state.hoverPart;
        state.hintSeconds = 0.f;
    } else if (dtSeconds > 0.f) {
        state.hintSeconds += dtSeconds;
    }

    for (std::size_t i = 0; i < state.hover.size(); ++i) {
        bool hot = static_cast<std::size_t>(state.hoverPart) == i;
        updateFade(state.hover[i], hot, dtSeconds);
    }

    if (state.statusRemaining > 0.f) {
        state.statusRemaining -= dtSeconds;
        if (state.statusRemaining <= 0.f) {
            state.statusRemaining = 0.f;
            state.statusText.clear();
        }
    }
}

bool resizeWidget(WidgetState& state, sf::Vector2u size) {
    state.stars.regenerate(size);
    if (!state.frame.resize(size)) {
        LOG_ERROR("Widget", "RenderTexture resize failed for " +
                            std::to_string(size.x) + "x" + std::to_string(size.y));
        return false;
    }
    state.frame.setSmooth(true);
    return true;
}

// ============================================================
// Actions
// ============================================================
void toggleControls(WidgetState& state) {
    state.controlsVisible = !state.controlsVisible;
    if (!state.controlsVisible) {
        state.aspectLocked = false;
    }
    LOG_TRACE("Widget", std::string("Controls ") + (state.controlsVisible ? "shown" : "hidden"));
}

bool clickAddButton(WidgetState& state, long long nowMs) {
    if (state.addClicks.click(static_cast<int>(WidgetPart::AddButton), nowMs)) {
        return true;
    }
    toggleControls(state);
    return false;
}

void applyBackgroundImage(WidgetState& state, const std::string& path) {
    ActionResult result = state.background.setImage(path);
    auto ratio = state.background.aspectRatio();
    if (result.success && ratio) {
        state.aspect = *ratio;
        state.aspectLocked = true;
    } else {
        state.aspectLocked = false;
    }
    flashStatus(state, result);
}

void selectBackgroundImage(sf::RenderWindow& window, WidgetState& state) {
    std::string err;
    auto path = pickImageFile(window, &err);
    if (!path) {
        if (!err.empty()) {
            flashStatus(state, ErrorManager::report("ERR_PICKER_UNAVAILABLE", err));
        }
        return;
    }
    applyBackgroundImage(state, *path);
}

void resetBackground(WidgetState& state) {
    state.background.clearImage();
    state.controlsVisible = false;
    state.aspectLocked = false;
    LOG_TRACE("Widget", "Background reset");
}

void setBackgroundAlpha(WidgetState& state, int alpha) {
    state.background.setAlpha(alpha);
}

void flashStatus(WidgetState& state, const ActionResult& result) {
    if (result.message.empty()) return;
    state.statusText = result.message;
    state.statusColor = result.color;
    state.statusRemaining = kStatusSeconds;
}

void captureSettings(const sf::RenderWindow& window, WidgetState& state) {
    state.settings.width  = window.getSize().x;
    state.settings.height = window.getSize().y;
    state.settings.posX   = window.getPosition().x;
    state.settings.posY   = window.getPosition().y;
    state.settings.imagePath = state.background.imagePath();
    state.settings.alpha  = state.background.alpha();
}

const char* activeHint(const WidgetState& state) {
    if (state.mode != WidgetState::Mode::Idle) return nullptr;
    if (state.hintPart != state.hoverPart) return nullptr;
    if (state.hintSeconds < kHintDelaySeconds) return nullptr;
    return hintFor(state.hoverPart);
}
