#pragma once

#include <chrono>
#include <string>

namespace vidseal {

/// Local wall-clock time as "YYYY-MM-DD HH:MM:SS".
std::string formatWallClock(std::chrono::system_clock::time_point tp);

/// formatWallClock() of the current time.
std::string wallClockNow();

} // namespace vidseal
