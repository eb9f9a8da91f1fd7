#pragma once
#include <SFML/Graphics.hpp>
#include "widget.hpp"

// Draw the whole widget into `target` (stars, body, controls, time).
// `font` may be null when no font was found: shapes still draw, text is skipped.
void drawUI(sf::RenderTarget& target,
            const sf::Font* font,
            const WidgetState& state,
            const WidgetLayout& layout);
