#pragma once
#include <SFML/Graphics/RenderTarget.hpp>
#include <SFML/System/Vector2.hpp>
#include <cstdint>
#include <random>
#include <vector>

/// StarField
/// Decorative dots scattered over the widget, re-scattered on every resize.
/// With twinkle on, each star's brightness oscillates with its own phase/rate.
class StarField {
public:
    struct Star {
        sf::Vector2f position;
        float phase = 0.f;   // radians
        float rate  = 1.f;   // radians per second
    };

    explicit StarField(unsigned count = 50, unsigned seed = std::random_device{}());

    /// Scatter `count` stars inside a widget of the given size (none if empty).
    void regenerate(sf::Vector2u size);

    void setCount(unsigned count) { count_ = count; }
    void setTwinkle(bool on) { twinkle_ = on; }

    /// Advance the twinkle clock.
    void update(float dtSeconds);

    /// Current alpha of a star (constant 200 without twinkle).
    std::uint8_t alphaOf(const Star& star) const;

    void draw(sf::RenderTarget& target) const;

    const std::vector<Star>& stars() const { return stars_; }

private:
    std::mt19937 rng_;
    unsigned count_;
    bool twinkle_ = true;
    float time_ = 0.f;
    std::vector<Star> stars_;
};
