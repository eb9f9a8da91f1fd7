#pragma once
#include <SFML/Graphics/Color.hpp>

// ---------------- UI Tunables ----------------
// All constants here control layout and appearance of the NekoToki widget.
// Adjust them in one place to restyle the widget consistently.

/// Content margins (pixels).
inline constexpr float kMarginLeft   = 10.f;
inline constexpr float kMarginTop    = 5.f;
inline constexpr float kMarginRight  = 10.f;
inline constexpr float kMarginBottom = 10.f;

/// Vertical gap between rows (pixels).
inline constexpr float kRowSpacing = 4.f;

/// Round top-bar buttons ("+" and close), diameter in pixels.
inline constexpr float kTopButtonSize = 20.f;

/// Background-controls row height and font size.
inline constexpr float kControlsRowH = 16.f;
inline constexpr unsigned kControlsFontSize = 10;

/// Play/Pause + Reset row height.
inline constexpr float kMainButtonH = 26.f;
inline constexpr float kMainButtonSpacing = 6.f;

/// Time text sizes (points).
inline constexpr unsigned kTimeFontSize = 24;
inline constexpr unsigned kHundredthsFontSize = 14;
inline constexpr unsigned kStatusFontSize = 10;

/// Corner radius of the widget body and of the main buttons.
inline constexpr float kBodyRadius = 15.f;
inline constexpr float kButtonRadius = 10.f;

/// Frame rate of the render loop.
inline constexpr unsigned kFrameRateLimit = 60;

/// Two clicks closer than this count as a double click (ms).
inline constexpr int kDoubleClickMs = 400;

/// How long a status message stays up (seconds).
inline constexpr float kStatusSeconds = 3.f;

/// Hover time before a control's hint shows in the status line (seconds).
inline constexpr float kHintDelaySeconds = 0.7f;

// ---------------- Palette ----------------
inline const sf::Color kBackgroundBase(146, 149, 196);
inline const sf::Color kBorderColor(235, 226, 155, 100);
inline const sf::Color kTextColor(235, 226, 155, 220);
inline const sf::Color kIconOnYellow(146, 149, 196, 220);
inline const sf::Color kStarColor(255, 255, 255, 200);

// Button fills: {idle, hover} alpha pairs share a base color
inline const sf::Color kPlayBase(235, 226, 155);
inline const sf::Color kPauseBase(220, 150, 150);
inline const sf::Color kResetBase(176, 179, 226);
inline const sf::Color kCloseHoverBase(146, 149, 196);

inline constexpr float kButtonIdleAlpha  = 140.f;
inline constexpr float kButtonHoverAlpha = 180.f;
inline constexpr float kButtonPressAlpha = 220.f;


/// Plain-background alpha restored by "Reset BG" or a failed image load.
inline constexpr int kDefaultBackgroundAlpha = 120;
