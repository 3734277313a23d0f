#include "fingerprint/frame.h"

namespace vidseal {

Frame Frame::solid(std::uint32_t height, std::uint32_t width,
                   std::uint32_t channels, std::uint8_t value) {
  Frame f;
  f.height = height;
  f.width = width;
  f.channels = channels;
  f.pixels.assign(f.bytes(), value);
  return f;
}

} // namespace vidseal
