#pragma once
#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/ConvexShape.hpp>
#include <SFML/Graphics/Rect.hpp>
#include <SFML/System/Vector2.hpp>

// Rounded rectangle at (0,0) of the given size; radius is clamped to half the short side
sf::ConvexShape makeRoundedRect(sf::Vector2f size, float radius, unsigned pointsPerCorner = 8);

// Texture sub-rect that covers `target` while keeping the texture's aspect
// (centred crop)
sf::IntRect coverTextureRect(sf::Vector2u textureSize, sf::Vector2f target);

// Copy of `c` with alpha replaced (clamped to 0..255)
sf::Color withAlpha(sf::Color c, float alpha);

// ============================================================
// Double-click detection on one target
// ============================================================
class ClickTracker {
public:
    explicit ClickTracker(int thresholdMs) : thresholdMs_(thresholdMs) {}

    /// Register a click at `nowMs` on `target`; true if it completes a double click.
    /// A completed double click is consumed (a third click starts over).
    bool click(int target, long long nowMs);

private:
    int thresholdMs_;
    int lastTarget_ = -1;
    long long lastMs_ = 0;
};
