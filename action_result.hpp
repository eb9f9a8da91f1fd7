#pragma once
#include <string>
#include <SFML/Graphics/Color.hpp>

// ------------------------------------------------------------
// ActionResult: outcome of a user action on the widget
// (image selection, font/config loading, overlay setup)
// ------------------------------------------------------------
struct ActionResult {
    std::string message;    // user-facing text (flashed in the status line)
    bool success = true;    // true if the action succeeded
    sf::Color color = sf::Color::White;  // status line color
    std::string errorCode;  // ErrorManager code, "" or "ERR_NONE" when ok
};

inline ActionResult okResult(const std::string& message = "") {
    return { message, true, sf::Color(235, 226, 155), "ERR_NONE" };
}
