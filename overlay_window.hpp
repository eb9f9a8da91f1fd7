#pragma once
#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/Graphics/Texture.hpp>
#include <optional>
#include <string>

// ===========================================================
// Platform overlay window helpers
// ===========================================================

// Keep the frameless widget above other windows. On Win32 the window also
// becomes a per-pixel-alpha layered window. Returns false if unsupported.
bool makeOverlayWindow(sf::RenderWindow& window);

// True when presentFrame() keeps the frame's alpha (transparent corners)
bool overlaySupportsAlpha();

// Put a finished off-screen frame on screen
void presentFrame(sf::RenderWindow& window, const sf::Texture& frame);

// Native "open image" dialog. nullopt on cancel; when no dialog could be
// shown at all, *err receives the reason.
std::optional<std::string> pickImageFile(sf::RenderWindow& window, std::string* err = nullptr);
