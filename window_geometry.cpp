#include "window_geometry.hpp"
#include <algorithm>
#include <cmath>

ResizeEdges detectResizeEdges(sf::Vector2i local, sf::Vector2u windowSize, int margin) {
    ResizeEdges e;
    const int w = static_cast<int>(windowSize.x);
    const int h = static_cast<int>(windowSize.y);

    if (local.x < 0 || local.y < 0 || local.x >= w || local.y >= h) {
        return e;
    }

    e.left   = local.x < margin;
    e.right  = local.x >= w - margin;
    e.top    = local.y < margin;
    e.bottom = local.y >= h - margin;

    // A window narrower than two margins would otherwise grab both sides
    if (e.left && e.right) e.right = false;
    if (e.top && e.bottom) e.bottom = false;
    return e;
}

// ===========================================================
// Resize
// ===========================================================
static int ceilToInt(float v) {
    return static_cast<int>(std::ceil(v));
}

sf::IntRect computeResize(const sf::IntRect& start,
                          ResizeEdges edges,
                          sf::Vector2i delta,
                          sf::Vector2i minSize,
                          float aspect) {
    const int startLeft   = start.position.x;
    const int startTop    = start.position.y;
    const int startRight  = start.position.x + start.size.x;
    const int startBottom = start.position.y + start.size.y;

    int w = start.size.x;
    int h = start.size.y;

    if (edges.left)   w = start.size.x - delta.x;
    if (edges.right)  w = start.size.x + delta.x;
    if (edges.top)    h = start.size.y - delta.y;
    if (edges.bottom) h = start.size.y + delta.y;

    w = std::max(w, minSize.x);
    h = std::max(h, minSize.y);

    if (aspect > 0.f) {
        if (edges.horizontalOnly()) {
            // Width leads
            h = std::max(minSize.y, ceilToInt(static_cast<float>(w) / aspect));
            w = std::max(minSize.x, ceilToInt(static_cast<float>(h) * aspect));
        } else {
            // Height leads (top/bottom edges and all corners)
            w = std::max(minSize.x, ceilToInt(static_cast<float>(h) * aspect));
            h = std::max(minSize.y, ceilToInt(static_cast<float>(w) / aspect));
        }
    }

    // Opposite edge stays put. With the aspect locked, a lone top edge also
    // keeps the right side and a lone left edge also keeps the bottom.
    bool anchorRight  = edges.left;
    bool anchorBottom = edges.top;
    if (aspect > 0.f) {
        if (edges.top && !edges.left && !edges.right) anchorRight = true;
        if (edges.left && !edges.top && !edges.bottom) anchorBottom = true;
    }

    const int x = anchorRight ? startRight - w : startLeft;
    const int y = anchorBottom ? startBottom - h : startTop;
    return sf::IntRect({x, y}, {w, h});
}

sf::Cursor::Type cursorForEdges(ResizeEdges edges) {
    if ((edges.top && edges.left) || (edges.bottom && edges.right))
        return sf::Cursor::Type::SizeTopLeftBottomRight;
    if ((edges.top && edges.right) || (edges.bottom && edges.left))
        return sf::Cursor::Type::SizeBottomLeftTopRight;
    if (edges.left || edges.right)
        return sf::Cursor::Type::SizeHorizontal;
    if (edges.top || edges.bottom)
        return sf::Cursor::Type::SizeVertical;
    return sf::Cursor::Type::Arrow;
}

sf::Vector2i initialWindowPosition(sf::Vector2u desktop, sf::Vector2u windowSize,
                                   int configuredX, int configuredY) {
    if (configuredX >= 0 && configuredY >= 0) {
        return { configuredX, configuredY };
    }

    const int margin = 16;
    int x = static_cast<int>(desktop.x) - static_cast<int>(windowSize.x) - margin;
    int y = margin;
    return { std::max(0, x), y };
}
