#include "utilities/timestamp.hpp"

#include <ctime>

namespace vidseal {

std::string formatWallClock(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm local{};
  localtime_r(&t, &local);
  char buf[20];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
  return std::string(buf);
}

std::string wallClockNow() {
  return formatWallClock(std::chrono::system_clock::now());
}

} // namespace vidseal
