#pragma once
#include <SFML/Graphics/Rect.hpp>
#include <SFML/System/Vector2.hpp>

// ===========================================================
// Widget layout (window-local pixels)
// ===========================================================

enum class WidgetPart {
    None,
    AddButton,        // "+": click toggles controls, double click picks image
    CloseButton,
    AlphaSlider,
    ChangeImage,
    ResetBackground,
    PlayPause,
    Reset
};

struct WidgetLayout {
    sf::Vector2f size;

    // Top bar
    sf::FloatRect addButton;
    sf::FloatRect closeButton;
    sf::FloatRect status;            // between the two top buttons

    // Background controls row (zero-sized while hidden)
    bool controlsVisible = false;
    sf::FloatRect alphaLabel;
    sf::FloatRect alphaSlider;
    sf::FloatRect changeImage;
    sf::FloatRect resetBackground;

    // Centre + bottom row
    sf::FloatRect timeArea;
    sf::FloatRect playPause;
    sf::FloatRect reset;
};

WidgetLayout computeLayout(sf::Vector2f size, bool controlsVisible);

// Control under `point`, None for empty chrome (drag/resize area)
WidgetPart hitTest(const WidgetLayout& layout, sf::Vector2f point);

// Slider value (0..255) for a pointer x over the track, clamped
int sliderValueAt(const sf::FloatRect& track, float x);

// Handle centre x for a value, inverse of sliderValueAt
float sliderHandleX(const sf::FloatRect& track, int value);

const char* toString(WidgetPart part);

// Hover hint for a control, nullptr where there is none
const char* hintFor(WidgetPart part);
