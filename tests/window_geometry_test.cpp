#include <gtest/gtest.h>
#include "window_geometry.hpp"

// ============================================================
// Edge detection
// ============================================================
TEST(ResizeEdgesTest, InteriorGrabsNothing) {
    ResizeEdges e = detectResizeEdges({100, 50}, {200, 100}, 5);
    EXPECT_FALSE(e.any());
}

TEST(ResizeEdgesTest, SidesAndCorners) {
    ResizeEdges left = detectResizeEdges({2, 50}, {200, 100}, 5);
    EXPECT_TRUE(left.left);
    EXPECT_FALSE(left.top || left.bottom || left.right);
    EXPECT_TRUE(left.horizontalOnly());

    ResizeEdges corner = detectResizeEdges({197, 97}, {200, 100}, 5);
    EXPECT_TRUE(corner.right);
    EXPECT_TRUE(corner.bottom);
    EXPECT_FALSE(corner.horizontalOnly());

    ResizeEdges top = detectResizeEdges({100, 4}, {200, 100}, 5);
    EXPECT_TRUE(top.top);
    EXPECT_FALSE(top.horizontalOnly());
}

TEST(ResizeEdgesTest, OutsideWindowGrabsNothing) {
    EXPECT_FALSE(detectResizeEdges({-1, 5}, {200, 100}, 5).any());
    EXPECT_FALSE(detectResizeEdges({200, 50}, {200, 100}, 5).any());
}

TEST(ResizeEdgesTest, TinyWindowPrefersLeftAndTop) {
    ResizeEdges e = detectResizeEdges({3, 3}, {6, 6}, 5);
    EXPECT_TRUE(e.left);
    EXPECT_TRUE(e.top);
    EXPECT_FALSE(e.right);
    EXPECT_FALSE(e.bottom);
}

// ============================================================
// Resize
// ============================================================
static const sf::IntRect kStart({100, 100}, {200, 100});
static const sf::Vector2i kMin(150, 80);

static ResizeEdges edges(bool l, bool r, bool t, bool b) {
    ResizeEdges e;
    e.left = l; e.right = r; e.top = t; e.bottom = b;
    return e;
}

TEST(ComputeResizeTest, RightEdgeGrowsWidth) {
    sf::IntRect r = computeResize(kStart, edges(false, true, false, false), {50, 7}, kMin);
    EXPECT_EQ(r, sf::IntRect({100, 100}, {250, 100}));
}

TEST(ComputeResizeTest, LeftEdgeKeepsRightAnchored) {
    sf::IntRect r = computeResize(kStart, edges(true, false, false, false), {30, 0}, kMin);
    EXPECT_EQ(r, sf::IntRect({130, 100}, {170, 100}));
}

TEST(ComputeResizeTest, MinimumSizeHoldsAnchor) {
    sf::IntRect r = computeResize(kStart, edges(true, false, true, false), {100, 100}, kMin);
    EXPECT_EQ(r.size, sf::Vector2i(150, 80));
    EXPECT_EQ(r.position.x + r.size.x, 300);
    EXPECT_EQ(r.position.y + r.size.y, 200);
}

TEST(ComputeResizeTest, AspectLockedCornerHeightLeads) {
    sf::IntRect r = computeResize(kStart, edges(true, false, true, false), {-20, -20}, kMin, 2.f);
    EXPECT_EQ(r, sf::IntRect({60, 80}, {240, 120}));
}

TEST(ComputeResizeTest, AspectLockedSideWidthLeads) {
    sf::IntRect r = computeResize(kStart, edges(false, true, false, false), {40, 0}, kMin, 2.f);
    EXPECT_EQ(r, sf::IntRect({100, 100}, {240, 120}));
}

TEST(ComputeResizeTest, AspectLockedRespectsMinimum) {
    sf::IntRect r = computeResize(kStart, edges(false, false, false, true), {0, -50}, kMin, 2.f);
    EXPECT_EQ(r, sf::IntRect({100, 100}, {160, 80}));
}

TEST(ComputeResizeTest, AspectLockedTopEdgeGrowsLeftToo) {
    sf::IntRect r = computeResize(kStart, edges(false, false, true, false), {0, -20}, kMin, 2.f);
    EXPECT_EQ(r, sf::IntRect({60, 80}, {240, 120}));
    EXPECT_EQ(r.position.x + r.size.x, 300);    // bottom-right corner fixed
    EXPECT_EQ(r.position.y + r.size.y, 200);
}

TEST(ComputeResizeTest, AspectLockedLeftEdgeGrowsUpToo) {
    sf::IntRect r = computeResize(kStart, edges(true, false, false, false), {-40, 0}, kMin, 2.f);
    EXPECT_EQ(r, sf::IntRect({60, 80}, {240, 120}));
}

TEST(ComputeResizeTest, FreeTopEdgeKeepsLeftSide) {
    sf::IntRect r = computeResize(kStart, edges(false, false, true, false), {0, -20}, kMin);
    EXPECT_EQ(r, sf::IntRect({100, 80}, {200, 120}));
}

// ============================================================
// Cursor + placement
// ============================================================
TEST(WindowGeometryTest, CursorFollowsEdges) {
    EXPECT_EQ(cursorForEdges(edges(false, false, false, false)), sf::Cursor::Type::Arrow);
    EXPECT_EQ(cursorForEdges(edges(true, false, false, false)), sf::Cursor::Type::SizeHorizontal);
    EXPECT_EQ(cursorForEdges(edges(false, false, false, true)), sf::Cursor::Type::SizeVertical);
    EXPECT_EQ(cursorForEdges(edges(true, false, true, false)), sf::Cursor::Type::SizeTopLeftBottomRight);
    EXPECT_EQ(cursorForEdges(edges(false, true, true, false)), sf::Cursor::Type::SizeBottomLeftTopRight);
}

TEST(WindowGeometryTest, InitialPositionTopRightByDefault) {
    EXPECT_EQ(initialWindowPosition({1920, 1080}, {200, 100}, -1, -1), sf::Vector2i(1704, 16));
    EXPECT_EQ(initialWindowPosition({1920, 1080}, {200, 100}, 10, 20), sf::Vector2i(10, 20));
    EXPECT_EQ(initialWindowPosition({1920, 1080}, {200, 100}, 10, -1), sf::Vector2i(1704, 16));
    EXPECT_EQ(initialWindowPosition({100, 100}, {200, 100}, -1, -1), sf::Vector2i(0, 16));
}
