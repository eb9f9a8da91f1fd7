#pragma once
#include <SFML/Graphics/RenderTarget.hpp>
#include <SFML/Graphics/Texture.hpp>
#include <optional>
#include <string>
#include "action_result.hpp"

/// BackgroundLayer
/// Rounded widget body: either the plain tinted fill with a border, or a
/// user image scaled to cover the widget. One alpha value drives both.
class BackgroundLayer {
public:
    BackgroundLayer(int defaultAlpha, int imageAlpha);

    /// Load an image; alpha jumps to the image alpha on success. On failure
    /// the image is cleared and the default alpha restored.
    ActionResult setImage(const std::string& path);

    /// Back to the plain background with the default alpha.
    void clearImage();

    void setAlpha(int alpha);
    int alpha() const { return alpha_; }

    bool hasImage() const { return hasImage_; }
    const std::string& imagePath() const { return imagePath_; }

    /// width / height of the current image, nullopt without one
    std::optional<float> aspectRatio() const;

    void draw(sf::RenderTarget& target, sf::Vector2f size) const;

private:
    int defaultAlpha_;
    int imageAlpha_;
    int alpha_;

    sf::Texture texture_;
    bool hasImage_ = false;
    std::string imagePath_;
};
