#include "ui_layout.hpp"
#include "ui_config.hpp"
#include <algorithm>
#include <cmath>

// Fixed widths of the controls row (the slider takes what is left)
static constexpr float kAlphaLabelW   = 30.f;
static constexpr float kChangeImageW  = 58.f;
static constexpr float kResetBgW      = 44.f;
static constexpr float kControlsGap   = 4.f;

WidgetLayout computeLayout(sf::Vector2f size, bool controlsVisible) {
    WidgetLayout l;
    l.size = size;
    l.controlsVisible = controlsVisible;

    const float innerW = std::max(0.f, size.x - kMarginLeft - kMarginRight);

    // --- Top bar ---
    l.addButton   = sf::FloatRect({kMarginLeft, kMarginTop}, {kTopButtonSize, kTopButtonSize});
    l.closeButton = sf::FloatRect({size.x - kMarginRight - kTopButtonSize, kMarginTop},
                                  {kTopButtonSize, kTopButtonSize});

    const float statusLeft = kMarginLeft + kTopButtonSize + kControlsGap;
    l.status = sf::FloatRect({statusLeft, kMarginTop},
                             {std::max(0.f, l.closeButton.position.x - kControlsGap - statusLeft),
                              kTopButtonSize});

    float y = kMarginTop + kTopButtonSize + kRowSpacing;

    // --- Controls row ---
    if (controlsVisible) {
        float x = kMarginLeft;
        l.alphaLabel = sf::FloatRect({x, y}, {kAlphaLabelW, kControlsRowH});
        x += kAlphaLabelW + kControlsGap;

        const float fixed = kAlphaLabelW + kChangeImageW + kResetBgW + 3.f * kControlsGap;
        const float sliderW = std::max(20.f, innerW - fixed);
        l.alphaSlider = sf::FloatRect({x, y}, {sliderW, kControlsRowH});
        x += sliderW + kControlsGap;

        l.changeImage = sf::FloatRect({x, y}, {kChangeImageW, kControlsRowH});
        x += kChangeImageW + kControlsGap;

        l.resetBackground = sf::FloatRect({x, y}, {kResetBgW, kControlsRowH});
        y += kControlsRowH + kRowSpacing;
    }

    // --- Bottom row ---
    const float buttonsTop = size.y - kMarginBottom - kMainButtonH;
    const float halfW = std::max(0.f, (innerW - kMainButtonSpacing) / 2.f);
    l.playPause = sf::FloatRect({kMarginLeft, buttonsTop}, {halfW, kMainButtonH});
    l.reset     = sf::FloatRect({kMarginLeft + halfW + kMainButtonSpacing, buttonsTop},
                                {halfW, kMainButtonH});

    // --- Time display fills the gap ---
    l.timeArea = sf::FloatRect({kMarginLeft, y},
                               {innerW, std::max(0.f, buttonsTop - kRowSpacing - y)});
    return l;
}

WidgetPart hitTest(const WidgetLayout& l, sf::Vector2f p) {
    if (l.addButton.contains(p))   return WidgetPart::AddButton;
    if (l.closeButton.contains(p)) return WidgetPart::CloseButton;

    if (l.controlsVisible) {
        if (l.alphaSlider.contains(p))     return WidgetPart::AlphaSlider;
        if (l.changeImage.contains(p))     return WidgetPart::ChangeImage;
        if (l.resetBackground.contains(p)) return WidgetPart::ResetBackground;
    }

    if (l.playPause.contains(p)) return WidgetPart::PlayPause;
    if (l.reset.contains(p))     return WidgetPart::Reset;
    return WidgetPart::None;
}

// ===========================================================
// Slider mapping
// ===========================================================
int sliderValueAt(const sf::FloatRect& track, float x) {
    if (track.size.x <= 0.f) return 0;
    float t = (x - track.position.x) / track.size.x;
    t = std::clamp(t, 0.f, 1.f);
    return static_cast<int>(std::lround(t * 255.f));
}

float sliderHandleX(const sf::FloatRect& track, int value) {
    float t = static_cast<float>(std::clamp(value, 0, 255)) / 255.f;
    return track.position.x + t * track.size.x;
}

const char* toString(WidgetPart part) {
    switch (part) {
        case WidgetPart::None:            return "None";
        case WidgetPart::AddButton:       return "AddButton";
        case WidgetPart::CloseButton:     return "CloseButton";
        case WidgetPart::AlphaSlider:     return "AlphaSlider";
        case WidgetPart::ChangeImage:     return "ChangeImage";
        case WidgetPart::ResetBackground: return "ResetBackground";
        case WidgetPart::PlayPause:       return "PlayPause";
        case WidgetPart::Reset:           return "Reset";
    }
    return "Unknown";
}

const char* hintFor(WidgetPart part) {
    switch (part) {
        case WidgetPart::AddButton:       return "Click: controls / Double click: image";
        case WidgetPart::CloseButton:     return "Close NekoToki";
        case WidgetPart::AlphaSlider:     return "Adjust Background Opacity";
        case WidgetPart::ChangeImage:     return "Select a new background image";
        case WidgetPart::ResetBackground: return "Reset to default background";
        default:                          return nullptr;
    }
}
