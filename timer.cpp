#include "timer.hpp"
#include <algorithm>

std::chrono::milliseconds clampTickInterval(long ms) {
    return std::chrono::milliseconds(std::clamp(ms, kMinTickIntervalMs, kMaxTickIntervalMs));
}

void startRefresh(RefreshTimer& timer, std::chrono::steady_clock::time_point now) {
    timer.expiry = now;
    timer.active = true;
}

void stopRefresh(RefreshTimer& timer) {
    timer.active = false;
}

bool checkRefreshExpired(RefreshTimer& timer, std::chrono::steady_clock::time_point now) {
    if (!timer.active || now < timer.expiry) {
        return false;
    }

    timer.expiry += timer.interval;
    if (timer.expiry <= now) {
        timer.expiry = now + timer.interval;
    }
    return true;
}
