#pragma once
#include <SFML/Graphics.hpp>
#include "widget.hpp"

// -------------------------------------------------------------
// Process all SFML events (SFML 3 style):
// - pollEvent() returns std::optional<sf::Event>
// - event data via getIf<T>()
//
// Mouse: buttons, slider, drag and edge resize of the frameless window.
// Keys:  Alt+Plus toggles, Alt+Minus pauses, Alt+0 resets.
//
// Returns false if the widget should close.
// -------------------------------------------------------------
bool processEvents(sf::RenderWindow& window, WidgetState& state);
