#include "background.hpp"
#include "error_manager.hpp"
#include "ui_config.hpp"
#include "ui_helpers.hpp"
#include "logger.hpp"

#include <algorithm>

BackgroundLayer::BackgroundLayer(int defaultAlpha, int imageAlpha)
    : defaultAlpha_(std::clamp(defaultAlpha, 0, 255)),
      imageAlpha_(std::clamp(imageAlpha, 0, 255)),
      alpha_(defaultAlpha_) {}

ActionResult BackgroundLayer::setImage(const std::string& path) {
    if (path.empty()) {
        clearImage();
        return okResult();
    }

    if (!texture_.loadFromFile(path)) {
        hasImage_ = false;
        imagePath_.clear();
        alpha_ = defaultAlpha_;
        return ErrorManager::report("ERR_BG_LOAD_FAILED", path);
    }

    texture_.setSmooth(true);
    hasImage_ = true;
    imagePath_ = path;
    alpha_ = imageAlpha_;

    LOG_DEBUG("Background", "Loaded " + path + " (" +
                            std::to_string(texture_.getSize().x) + "x" +
                            std::to_string(texture_.getSize().y) + ")");
    return okResult("Background set");
}

void BackgroundLayer::clearImage() {
    hasImage_ = false;
    imagePath_.clear();
    alpha_ = defaultAlpha_;
}

void BackgroundLayer::setAlpha(int alpha) {
    alpha_ = std::clamp(alpha, 0, 255);
}

std::optional<float> BackgroundLayer::aspectRatio() const {
    if (!hasImage_ || texture_.getSize().y == 0) return std::nullopt;
    return static_cast<float>(texture_.getSize().x) / static_cast<float>(texture_.getSize().y);
}

void BackgroundLayer::draw(sf::RenderTarget& target, sf::Vector2f size) const {
    sf::ConvexShape body = makeRoundedRect(size, kBodyRadius, 10);

    if (hasImage_) {
        // Image clipped to the rounded body; alpha via vertex color modulation
        body.setTexture(&texture_);
        body.setTextureRect(coverTextureRect(texture_.getSize(), size));
        body.setFillColor(withAlpha(sf::Color::White, static_cast<float>(alpha_)));
        target.draw(body);
        return;
    }

    // Plain body keeps a sliver of alpha so it still catches the mouse
    body.setFillColor(withAlpha(kBackgroundBase, static_cast<float>(std::max(1, alpha_))));
    body.setOutlineColor(kBorderColor);
    body.setOutlineThickness(-2.f);
    target.draw(body);
}
