#include "session/frame_io.h"

namespace vidseal {

TestPatternSource::TestPatternSource(std::uint32_t height, std::uint32_t width,
                                     std::uint32_t channels,
                                     std::uint64_t maxFrames)
    : height_(height), width_(width), channels_(channels),
      maxFrames_(maxFrames) {}

std::optional<Frame> TestPatternSource::next() {
  if (!isOpen())
    return std::nullopt;
  Frame f = Frame::solid(height_, width_, channels_, 0);
  for (std::uint32_t y = 0; y < height_; ++y)
    for (std::uint32_t x = 0; x < width_; ++x)
      for (std::uint32_t c = 0; c < channels_; ++c)
        f.at(y, x, c) = static_cast<std::uint8_t>(
            (x + 2ULL * y + 40ULL * c + produced_) % 256);
  ++produced_;
  return f;
}

} // namespace vidseal
