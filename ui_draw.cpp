#include "ui_draw.hpp"
#include "ui_helpers.hpp"
#include <algorithm>
#include <cmath>

// ============================================================
// Small drawing helpers
// ============================================================
static float hoverOf(const WidgetState& state, WidgetPart part) {
    return state.hover[static_cast<std::size_t>(part)].value;
}

static float buttonAlpha(const WidgetState& state, WidgetPart part) {
    if (state.pressedPart == part && state.hoverPart == part) {
        return kButtonPressAlpha;
    }
    return blendAlpha(kButtonIdleAlpha, kButtonHoverAlpha, hoverOf(state, part));
}

static void drawRoundedButton(sf::RenderTarget& target, const sf::FloatRect& rect,
                              sf::Color base, float alpha, float radius, bool outline) {
    sf::ConvexShape shape = makeRoundedRect(rect.size, radius, 6);
    shape.setPosition(rect.position);
    shape.setFillColor(withAlpha(base, alpha));
    if (outline) {
        shape.setOutlineColor(withAlpha(base, 180.f));
        shape.setOutlineThickness(-1.f);
    }
    target.draw(shape);
}

static sf::Vector2f centerOf(const sf::FloatRect& r) {
    return r.position + r.size / 2.f;
}

// Bar of thickness t from the centre, rotated by `deg`
static void drawBar(sf::RenderTarget& target, sf::Vector2f c, float length, float t,
                    float deg, sf::Color color) {
    sf::RectangleShape bar({length, t});
    bar.setOrigin({length / 2.f, t / 2.f});
    bar.setPosition(c);
    bar.setRotation(sf::degrees(deg));
    bar.setFillColor(color);
    target.draw(bar);
}

static void drawText(sf::RenderTarget& target, const sf::Font& font, const std::string& str,
                     unsigned size, sf::Vector2f center, sf::Color color, bool bold,
                     float maxWidth = 0.f) {
    sf::Text text(font, str, size);
    if (bold) text.setStyle(sf::Text::Bold);
    text.setFillColor(color);

    sf::FloatRect b = text.getLocalBounds();
    text.setOrigin(b.position + b.size / 2.f);
    if (maxWidth > 0.f && b.size.x > maxWidth) {
        float k = maxWidth / b.size.x;
        text.setScale({k, k});
    }
    text.setPosition(center);
    target.draw(text);
}

// ============================================================
// Icons (shapes only, no glyph dependency)
// ============================================================
static void drawPlayIcon(sf::RenderTarget& target, sf::Vector2f c, float s, sf::Color color) {
    sf::ConvexShape tri(3);
    tri.setPoint(0, {c.x - s * 0.35f, c.y - s * 0.5f});
    tri.setPoint(1, {c.x + s * 0.5f,  c.y});
    tri.setPoint(2, {c.x - s * 0.35f, c.y + s * 0.5f});
    tri.setFillColor(color);
    target.draw(tri);
}

static void drawPauseIcon(sf::RenderTarget& target, sf::Vector2f c, float s, sf::Color color) {
    sf::RectangleShape bar({s * 0.28f, s});
    bar.setFillColor(color);
    bar.setPosition({c.x - s * 0.38f, c.y - s / 2.f});
    target.draw(bar);
    bar.setPosition({c.x + s * 0.10f, c.y - s / 2.f});
    target.draw(bar);
}

static void drawResetIcon(sf::RenderTarget& target, sf::Vector2f c, float s, sf::Color color) {
    const float r = s * 0.42f;
    sf::CircleShape ring(r);
    ring.setOrigin({r, r});
    ring.setPosition(c);
    ring.setFillColor(sf::Color::Transparent);
    ring.setOutlineColor(color);
    ring.setOutlineThickness(2.f);
    target.draw(ring);

    // Arrow head at the top of the ring, pointing counter-clockwise
    sf::ConvexShape head(3);
    head.setPoint(0, {c.x - s * 0.30f, c.y - r});
    head.setPoint(1, {c.x + s * 0.05f, c.y - r - s * 0.22f});
    head.setPoint(2, {c.x + s * 0.05f, c.y - r + s * 0.22f});
    head.setFillColor(color);
    target.draw(head);
}

// ============================================================
// Sections
// ============================================================
static void drawTopBar(sf::RenderTarget& target, const sf::Font* font,
                       const WidgetState& state, const WidgetLayout& layout) {
    // "+" button
    const float addAlpha = buttonAlpha(state, WidgetPart::AddButton);
    const float r = layout.addButton.size.x / 2.f;
    sf::CircleShape add(r);
    add.setPosition(layout.addButton.position);
    add.setFillColor(withAlpha(kPlayBase, addAlpha));
    target.draw(add);

    const sf::Vector2f addC = centerOf(layout.addButton);
    drawBar(target, addC, r * 1.1f, 2.f, 0.f, kIconOnYellow);
    drawBar(target, addC, r * 1.1f, 2.f, 90.f, kIconOnYellow);

    // Close button: transparent until hovered
    const float closeHover = hoverOf(state, WidgetPart::CloseButton);
    if (closeHover > 0.f) {
        sf::CircleShape bg(r);
        bg.setPosition(layout.closeButton.position);
        bg.setFillColor(withAlpha(kCloseHoverBase, 150.f * closeHover));
        target.draw(bg);
    }
    const sf::Vector2f closeC = centerOf(layout.closeButton);
    drawBar(target, closeC, r * 1.1f, 2.f, 45.f, kTextColor);
    drawBar(target, closeC, r * 1.1f, 2.f, -45.f, kTextColor);

    // Status line between them: messages first, hover hints otherwise
    if (!font) return;
    if (!state.statusText.empty()) {
        float fade = std::min(1.f, state.statusRemaining / 0.5f);
        sf::Color c = state.statusColor;
        c.a = static_cast<std::uint8_t>(220.f * fade);
        drawText(target, *font, state.statusText, kStatusFontSize,
                 centerOf(layout.status), c, false, layout.status.size.x);
    } else if (const char* hint = activeHint(state)) {
        drawText(target, *font, hint, kStatusFontSize,
                 centerOf(layout.status), withAlpha(kTextColor, 180.f), false,
                 layout.status.size.x);
    }
}

static void drawControlsRow(sf::RenderTarget& target, const sf::Font* font,
                            const WidgetState& state, const WidgetLayout& layout) {
    if (!layout.controlsVisible) return;

    if (font) {
        drawText(target, *font, "Alpha:", kControlsFontSize,
                 centerOf(layout.alphaLabel), kTextColor, false);
    }

    // Groove: filled part left of the handle, white to the right
    const sf::FloatRect& track = layout.alphaSlider;
    const float grooveH = 8.f;
    const float grooveY = track.position.y + (track.size.y - grooveH) / 2.f;
    const float handleX = sliderHandleX(track, state.background.alpha());

    sf::ConvexShape groove = makeRoundedRect({track.size.x, grooveH}, 4.f, 4);
    groove.setPosition({track.position.x, grooveY});
    groove.setFillColor(sf::Color::White);
    groove.setOutlineColor(sf::Color(187, 187, 187));
    groove.setOutlineThickness(1.f);
    target.draw(groove);

    const float filledW = handleX - track.position.x;
    if (filledW > 1.f) {
        sf::ConvexShape filled = makeRoundedRect({filledW, grooveH}, 4.f, 4);
        filled.setPosition({track.position.x, grooveY});
        filled.setFillColor(sf::Color(176, 179, 226, 180));
        target.draw(filled);
    }

    sf::ConvexShape handle = makeRoundedRect({13.f, grooveH + 4.f}, 4.f, 4);
    handle.setPosition({handleX - 6.5f, grooveY - 2.f});
    handle.setFillColor(sf::Color(221, 221, 221));
    handle.setOutlineColor(sf::Color(119, 119, 119));
    handle.setOutlineThickness(1.f);
    target.draw(handle);

    // Small text buttons
    drawRoundedButton(target, layout.changeImage, kResetBase,
                      buttonAlpha(state, WidgetPart::ChangeImage), 4.f, true);
    drawRoundedButton(target, layout.resetBackground, kResetBase,
                      buttonAlpha(state, WidgetPart::ResetBackground), 4.f, true);
    if (font) {
        drawText(target, *font, "Change Image", kControlsFontSize,
                 centerOf(layout.changeImage), kTextColor, false, layout.changeImage.size.x - 4.f);
        drawText(target, *font, "Reset BG", kControlsFontSize,
                 centerOf(layout.resetBackground), kTextColor, false, layout.resetBackground.size.x - 4.f);
    }
}

static void drawTime(sf::RenderTarget& target, const sf::Font* font,
                     const WidgetState& state, const WidgetLayout& layout) {
    if (!font || layout.timeArea.size.y <= 0.f) return;

    sf::Text mainText(*font, state.timeText.main, kTimeFontSize);
    sf::Text fracText(*font, state.timeText.hundredths, kHundredthsFontSize);
    mainText.setStyle(sf::Text::Bold);
    fracText.setStyle(sf::Text::Bold);
    mainText.setFillColor(kTextColor);
    fracText.setFillColor(kTextColor);

    const sf::FloatRect mb = mainText.getLocalBounds();
    const sf::FloatRect fb = fracText.getLocalBounds();
    const float gap = 2.f;
    const float total = mb.size.x + gap + fb.size.x;

    // Shrink the pair if the widget is narrower than the text
    float k = 1.f;
    if (total > layout.timeArea.size.x && total > 0.f) {
        k = layout.timeArea.size.x / total;
    }
    mainText.setScale({k, k});
    fracText.setScale({k, k});

    const sf::Vector2f c = centerOf(layout.timeArea);
    const float left = c.x - total * k / 2.f;
    const float mainTop = c.y - mb.size.y * k / 2.f;
    const float baseline = mainTop + mb.size.y * k;

    mainText.setPosition({left - mb.position.x * k, mainTop - mb.position.y * k});
    fracText.setPosition({left + (mb.size.x + gap) * k - fb.position.x * k,
                          baseline - (fb.position.y + fb.size.y) * k});
    target.draw(mainText);
    target.draw(fracText);
}

static void drawMainButtons(sf::RenderTarget& target, const WidgetState& state,
                            const WidgetLayout& layout) {
    const bool running = state.core.isRunning();
    const float iconSize = std::min(12.f, layout.playPause.size.y * 0.5f);

    drawRoundedButton(target, layout.playPause, running ? kPauseBase : kPlayBase,
                      buttonAlpha(state, WidgetPart::PlayPause), kButtonRadius, true);
    if (running) {
        drawPauseIcon(target, centerOf(layout.playPause), iconSize, kIconOnYellow);
    } else {
        drawPlayIcon(target, centerOf(layout.playPause), iconSize, kIconOnYellow);
    }

    drawRoundedButton(target, layout.reset, kResetBase,
                      buttonAlpha(state, WidgetPart::Reset), kButtonRadius, true);
    drawResetIcon(target, centerOf(layout.reset), iconSize, kTextColor);
}

// ============================================================
// Entry
// ============================================================
void drawUI(sf::RenderTarget& target,
            const sf::Font* font,
            const WidgetState& state,
            const WidgetLayout& layout) {
    // Stars first, the (translucent) body goes over them
    state.stars.draw(target);
    state.background.draw(target, layout.size);

    drawTopBar(target, font, state, layout);
    drawControlsRow(target, font, state, layout);
    drawTime(target, font, state, layout);
    drawMainButtons(target, state, layout);
}
