#include "time_format.hpp"
#include <iomanip>
#include <sstream>

TimeText formatElapsed(std::chrono::nanoseconds elapsed) {
    using namespace std::chrono;

    if (elapsed < nanoseconds::zero()) elapsed = nanoseconds::zero();

    // Work in whole centiseconds so every field truncates consistently
    long long cs = duration_cast<milliseconds>(elapsed).count() / 10;

    long long hours   = cs / 360000;
    long long minutes = (cs / 6000) % 60;
    long long seconds = (cs / 100) % 60;
    long long centis  = cs % 100;

    std::ostringstream main;
    main << std::setfill('0')
         << std::setw(2) << hours << ":"
         << std::setw(2) << minutes << ":"
         << std::setw(2) << seconds;

    std::ostringstream frac;
    frac << "." << std::setfill('0') << std::setw(2) << centis;

    return { main.str(), frac.str() };
}
