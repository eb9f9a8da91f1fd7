#include "ui_helpers.hpp"
#include <algorithm>
#include <cmath>

// ============================================================
// Rounded rectangle
// ============================================================
sf::ConvexShape makeRoundedRect(sf::Vector2f size, float radius, unsigned pointsPerCorner) {
    radius = std::clamp(radius, 0.f, std::min(size.x, size.y) / 2.f);
    pointsPerCorner = std::max(2u, pointsPerCorner);

    const float halfPi = 1.5707963f;
    const sf::Vector2f centers[4] = {
        { radius,          radius          },   // top-left
        { size.x - radius, radius          },   // top-right
        { size.x - radius, size.y - radius },   // bottom-right
        { radius,          size.y - radius },   // bottom-left
    };

    sf::ConvexShape shape(pointsPerCorner * 4);
    std::size_t index = 0;
    for (int corner = 0; corner < 4; ++corner) {
        // Start angles walk clockwise on screen: 180, 270, 0, 90 degrees
        float start = halfPi * static_cast<float>(corner + 2);
        for (unsigned i = 0; i < pointsPerCorner; ++i) {
            float a = start + halfPi * static_cast<float>(i) / static_cast<float>(pointsPerCorner - 1);
            shape.setPoint(index++, { centers[corner].x + std::cos(a) * radius,
                                      centers[corner].y + std::sin(a) * radius });
        }
    }
    return shape;
}

// ============================================================
// Cover crop
// ============================================================
sf::IntRect coverTextureRect(sf::Vector2u textureSize, sf::Vector2f target) {
    const float tw = static_cast<float>(textureSize.x);
    const float th = static_cast<float>(textureSize.y);
    if (tw <= 0.f || th <= 0.f || target.x <= 0.f || target.y <= 0.f) {
        return sf::IntRect({0, 0}, {static_cast<int>(textureSize.x), static_cast<int>(textureSize.y)});
    }

    const float targetAspect = target.x / target.y;
    float cropW = tw;
    float cropH = th;
    if (tw / th > targetAspect) {
        cropW = th * targetAspect;   // texture is wider: trim the sides
    } else {
        cropH = tw / targetAspect;   // texture is taller: trim top/bottom
    }

    int w = std::max(1, static_cast<int>(std::lround(cropW)));
    int h = std::max(1, static_cast<int>(std::lround(cropH)));
    int x = static_cast<int>(std::lround((tw - static_cast<float>(w)) / 2.f));
    int y = static_cast<int>(std::lround((th - static_cast<float>(h)) / 2.f));
    return sf::IntRect({x, y}, {w, h});
}

sf::Color withAlpha(sf::Color c, float alpha) {
    c.a = static_cast<std::uint8_t>(std::clamp(std::lround(alpha), 0L, 255L));
    return c;
}

// ============================================================
// Double click
// ============================================================
bool ClickTracker::click(int target, long long nowMs) {
    bool isDouble = (target == lastTarget_) && (nowMs - lastMs_ <= thresholdMs_);
    if (isDouble) {
        lastTarget_ = -1;
        return true;
    }
    lastTarget_ = target;
    lastMs_ = nowMs;
    return false;
}
