#include "star_field.hpp"
#include "ui_config.hpp"

#include <SFML/Graphics/CircleShape.hpp>
#include <cmath>

static constexpr float kTwoPi = 6.2831853f;

StarField::StarField(unsigned count, unsigned seed)
    : rng_(seed), count_(count) {}

void StarField::regenerate(sf::Vector2u size) {
    stars_.clear();
    if (size.x == 0 || size.y == 0) return;

    std::uniform_int_distribution<unsigned> xs(0, size.x - 1);
    std::uniform_int_distribution<unsigned> ys(0, size.y - 1);
    std::uniform_real_distribution<float> phase(0.f, kTwoPi);
    std::uniform_real_distribution<float> rate(0.8f, 2.5f);

    stars_.reserve(count_);
    for (unsigned i = 0; i < count_; ++i) {
        Star s;
        s.position = { static_cast<float>(xs(rng_)), static_cast<float>(ys(rng_)) };
        s.phase = phase(rng_);
        s.rate  = rate(rng_);
        stars_.push_back(s);
    }
}

void StarField::update(float dtSeconds) {
    if (dtSeconds <= 0.f) return;
    // Wrap to keep sin() arguments small over long sessions
    time_ = std::fmod(time_ + dtSeconds, 3600.f);
}

std::uint8_t StarField::alphaOf(const Star& star) const {
    const float base = static_cast<float>(kStarColor.a);
    if (!twinkle_) return kStarColor.a;

    float wave = 0.55f + 0.45f * std::sin(time_ * star.rate + star.phase);
    return static_cast<std::uint8_t>(std::lround(base * wave));
}

void StarField::draw(sf::RenderTarget& target) const {
    sf::CircleShape dot(1.f);
    dot.setOrigin({1.f, 1.f});

    for (const auto& s : stars_) {
        sf::Color c = kStarColor;
        c.a = alphaOf(s);
        dot.setFillColor(c);
        dot.setPosition(s.position);
        target.draw(dot);
    }
}
