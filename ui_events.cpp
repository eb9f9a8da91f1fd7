#include "ui_events.hpp"
#include "logger.hpp"
#include <map>

// ============================================================
// Cursor cache (sf::Cursor must outlive the window's use of it)
// ============================================================
static std::map<sf::Cursor::Type, sf::Cursor> s_cursors;
static sf::Cursor::Type s_currentCursor = sf::Cursor::Type::Arrow;

static void setCursor(sf::RenderWindow& window, sf::Cursor::Type type) {
    if (type == s_currentCursor) return;

    auto it = s_cursors.find(type);
    if (it == s_cursors.end()) {
        auto cursor = sf::Cursor::createFromSystem(type);
        if (!cursor) {
            LOG_DEBUG("Events", "System cursor not available, keeping current one");
            return;
        }
        it = s_cursors.emplace(type, std::move(*cursor)).first;
    }
    window.setMouseCursor(it->second);
    s_currentCursor = type;
}

static WidgetLayout layoutFor(const sf::RenderWindow& window, const WidgetState& state) {
    return computeLayout(sf::Vector2f(window.getSize()), state.controlsVisible);
}

// ============================================================
// Button actions
// ============================================================
static void activate(sf::RenderWindow& window, WidgetState& state, WidgetPart part) {
    LOG_TRACE("Events", std::string("Activate ") + toString(part));

    switch (part) {
        case WidgetPart::AddButton: {
            long long nowMs = state.clickClock.getElapsedTime().asMilliseconds();
            if (clickAddButton(state, nowMs)) {
                selectBackgroundImage(window, state);
            }
            break;
        }
        case WidgetPart::CloseButton:
            state.closeRequested = true;
            break;
        case WidgetPart::ChangeImage:
            selectBackgroundImage(window, state);
            break;
        case WidgetPart::ResetBackground:
            resetBackground(state);
            break;
        case WidgetPart::PlayPause:
            state.core.toggle();
            break;
        case WidgetPart::Reset:
            state.core.reset();
            break;
        case WidgetPart::AlphaSlider:
        case WidgetPart::None:
            break;
    }
}

// ============================================================
// Mouse
// ============================================================
static void onMousePressed(sf::RenderWindow& window, WidgetState& state, sf::Vector2i local) {
    const WidgetLayout layout = layoutFor(window, state);
    const WidgetPart part = hitTest(layout, sf::Vector2f(local));

    if (part == WidgetPart::AlphaSlider) {
        state.mode = WidgetState::Mode::Sliding;
        setBackgroundAlpha(state, sliderValueAt(layout.alphaSlider, static_cast<float>(local.x)));
        return;
    }
    if (part != WidgetPart::None) {
        state.pressedPart = part;
        return;
    }

    ResizeEdges edges = detectResizeEdges(local, window.getSize(), state.settings.borderMargin);
    if (edges.any()) {
        state.mode = WidgetState::Mode::Resizing;
        state.resizeEdges = edges;
        state.resizeStart = sf::IntRect(window.getPosition(), sf::Vector2i(window.getSize()));
        state.pressMouse = sf::Mouse::getPosition();
        return;
    }

    state.mode = WidgetState::Mode::Dragging;
    state.dragOffset = sf::Mouse::getPosition() - window.getPosition();
}

static void onMouseMoved(sf::RenderWindow& window, WidgetState& state, sf::Vector2i local) {
    switch (state.mode) {
        case WidgetState::Mode::Dragging:
            window.setPosition(sf::Mouse::getPosition() - state.dragOffset);
            return;

        case WidgetState::Mode::Resizing: {
            sf::Vector2i delta = sf::Mouse::getPosition() - state.pressMouse;
            sf::IntRect r = computeResize(state.resizeStart, state.resizeEdges, delta,
                                          sf::Vector2i(static_cast<int>(state.settings.minWidth),
                                                       static_cast<int>(state.settings.minHeight)),
                                          state.aspectLocked ? state.aspect : 0.f);
            if (r.position != window.getPosition()) {
                window.setPosition(r.position);
            }
            if (sf::Vector2u(r.size) != window.getSize()) {
                window.setSize(sf::Vector2u(r.size));
            }
            return;
        }

        case WidgetState::Mode::Sliding: {
            const WidgetLayout layout = layoutFor(window, state);
            setBackgroundAlpha(state, sliderValueAt(layout.alphaSlider, static_cast<float>(local.x)));
            return;
        }

        case WidgetState::Mode::Idle:
            break;
    }

    // Hover + cursor shape
    const WidgetLayout layout = layoutFor(window, state);
    state.hoverPart = hitTest(layout, sf::Vector2f(local));
    if (state.hoverPart == WidgetPart::None) {
        setCursor(window, cursorForEdges(
            detectResizeEdges(local, window.getSize(), state.settings.borderMargin)));
    } else {
        setCursor(window, sf::Cursor::Type::Arrow);
    }
}

static void onMouseReleased(sf::RenderWindow& window, WidgetState& state, sf::Vector2i local) {
    const WidgetState::Mode mode = state.mode;
    state.mode = WidgetState::Mode::Idle;

    if (mode == WidgetState::Mode::Resizing) {
        state.resizeEdges = ResizeEdges{};
        LOG_TRACE("Events", "Resized to " + std::to_string(window.getSize().x) + "x" +
                            std::to_string(window.getSize().y));
        return;
    }
    if (mode != WidgetState::Mode::Idle) return;

    const WidgetPart pressed = state.pressedPart;
    state.pressedPart = WidgetPart::None;
    if (pressed == WidgetPart::None) return;

    // Only a release over the pressed control counts as a click
    const WidgetLayout layout = layoutFor(window, state);
    if (hitTest(layout, sf::Vector2f(local)) == pressed) {
        activate(window, state, pressed);
    }
}

// ============================================================
// Keyboard shortcuts
// ============================================================
static void onKeyPressed(const sf::Event::KeyPressed& key, WidgetState& state) {
    if (!key.alt) return;

    switch (key.code) {
        case sf::Keyboard::Key::Equal:
        case sf::Keyboard::Key::Add:
            state.core.toggle();
            break;
        case sf::Keyboard::Key::Hyphen:
        case sf::Keyboard::Key::Subtract:
            state.core.pause();
            break;
        case sf::Keyboard::Key::Num0:
        case sf::Keyboard::Key::Numpad0:
            state.core.reset();
            break;
        default:
            break;
    }
}

// -------------------------------------------------------------
// Handle UI events (SFML 3 style: is<T>() + getIf<T>())
// -------------------------------------------------------------
bool processEvents(sf::RenderWindow& window, WidgetState& state)
{
    while (auto evOpt = window.pollEvent()) {
        const sf::Event& ev = *evOpt;

        // Handle quit
        if (ev.is<sf::Event::Closed>()) {
            state.closeRequested = true;
            return false;
        }

        if (const auto* resized = ev.getIf<sf::Event::Resized>()) {
            window.setView(sf::View(sf::FloatRect({0.f, 0.f}, sf::Vector2f(resized->size))));
            resizeWidget(state, resized->size);
        }

        if (const auto* press = ev.getIf<sf::Event::MouseButtonPressed>()) {
            if (press->button == sf::Mouse::Button::Left) {
                onMousePressed(window, state, press->position);
            }
        }

        if (const auto* move = ev.getIf<sf::Event::MouseMoved>()) {
            onMouseMoved(window, state, move->position);
        }

        if (const auto* release = ev.getIf<sf::Event::MouseButtonReleased>()) {
            if (release->button == sf::Mouse::Button::Left) {
                onMouseReleased(window, state, release->position);
            }
        }

        if (ev.is<sf::Event::MouseLeft>() && state.mode == WidgetState::Mode::Idle) {
            state.hoverPart = WidgetPart::None;
        }

        if (const auto* key = ev.getIf<sf::Event::KeyPressed>()) {
            onKeyPressed(*key, state);
        }

        if (state.closeRequested) {
            return false;
        }
    }

    return true;
}
