#pragma once
#include <chrono>
#include <string>

// Display strings for an elapsed duration: "HH:MM:SS" + ".CC"
struct TimeText {
    std::string main;        // hours grow past 99 without wrapping
    std::string hundredths;  // always two digits, truncated
};

TimeText formatElapsed(std::chrono::nanoseconds elapsed);
