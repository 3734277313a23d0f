#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <iostream>

namespace vidseal {

// If Logger::init() has not run yet, getInstance() falls back to an
// emergency console logger; only a failure of that fallback lands here.
void logError(const std::string &message) {
  try {
    Logger::getInstance().log(LogLevel::ERROR, message);
  } catch (const std::runtime_error &e) {
    std::cerr << "Logger not initialized. Original error: " << message
              << " Logger error: " << e.what() << std::endl;
  }
}

} // namespace vidseal
