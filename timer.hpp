#pragma once
#include <chrono>

// Periodic UI refresh timer, polled from the frame loop
struct RefreshTimer {
    std::chrono::milliseconds interval{50};          // tick period
    std::chrono::steady_clock::time_point expiry{};  // when the next tick is due
    bool active = false;
};

inline constexpr long kMinTickIntervalMs = 10;
inline constexpr long kMaxTickIntervalMs = 1000;

// Clamp a configured interval into [kMinTickIntervalMs, kMaxTickIntervalMs]
std::chrono::milliseconds clampTickInterval(long ms);

// Arm the timer; the first tick is due immediately
void startRefresh(RefreshTimer& timer, std::chrono::steady_clock::time_point now);

// Disarm; checkRefreshExpired() returns false until restarted
void stopRefresh(RefreshTimer& timer);

// True when a tick is due at `now`. Reschedules the next expiry; if the loop
// fell more than one interval behind, missed ticks collapse into this one.
bool checkRefreshExpired(RefreshTimer& timer, std::chrono::steady_clock::time_point now);
