#pragma once
#include <SFML/Graphics/Rect.hpp>
#include <SFML/System/Vector2.hpp>
#include <SFML/Window/Cursor.hpp>

// ===========================================================
// Frameless window drag / resize math (pure, desktop pixels)
// ===========================================================

// Which edges a resize grabs; a corner sets two of them
struct ResizeEdges {
    bool left   = false;
    bool right  = false;
    bool top    = false;
    bool bottom = false;

    bool any() const { return left || right || top || bottom; }
    bool horizontalOnly() const { return (left || right) && !top && !bottom; }
};

// Edges within `margin` pixels of the pointer (window-local coordinates)
ResizeEdges detectResizeEdges(sf::Vector2i local, sf::Vector2u windowSize, int margin);

// New window rect for a resize that started at `start` and has moved the
// pointer by `delta` since the press. The edge opposite each grabbed edge stays
// put and the size never drops below `minSize`.
// aspect > 0 locks width/height: height leads unless only a side edge is grabbed,
// and a lone top (left) edge grows toward the left (top) as well.
sf::IntRect computeResize(const sf::IntRect& start,
                          ResizeEdges edges,
                          sf::Vector2i delta,
                          sf::Vector2i minSize,
                          float aspect = 0.f);

// System cursor matching the grabbed edges (Arrow when none)
sf::Cursor::Type cursorForEdges(ResizeEdges edges);

// Initial placement: configured position if both >= 0, else the top-right
// corner of the desktop with a 16px margin
sf::Vector2i initialWindowPosition(sf::Vector2u desktop, sf::Vector2u windowSize,
                                   int configuredX, int configuredY);
