#ifndef VIDSEAL_FRAME_H
#define VIDSEAL_FRAME_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vidseal {

/**
 * @brief Owning 8-bit pixel buffer, row-major and channel-interleaved.
 *
 * A frame is well-formed when every dimension is non-zero and the buffer
 * holds exactly height * width * channels bytes.
 */
struct Frame {
  std::uint32_t height{0};
  std::uint32_t width{0};
  std::uint32_t channels{0};
  std::vector<std::uint8_t> pixels;

  /// Expected buffer size in bytes.
  [[nodiscard]] std::size_t bytes() const noexcept {
    return static_cast<std::size_t>(height) * width * channels;
  }

  [[nodiscard]] bool wellFormed() const noexcept {
    return height > 0 && width > 0 && channels > 0 && pixels.size() == bytes();
  }

  std::uint8_t &at(std::uint32_t y, std::uint32_t x, std::uint32_t c) {
    return pixels[offset(y, x, c)];
  }
  std::uint8_t at(std::uint32_t y, std::uint32_t x, std::uint32_t c) const {
    return pixels[offset(y, x, c)];
  }

  /// Frame of the given shape with every byte set to @p value.
  static Frame solid(std::uint32_t height, std::uint32_t width,
                     std::uint32_t channels, std::uint8_t value);

private:
  std::size_t offset(std::uint32_t y, std::uint32_t x,
                     std::uint32_t c) const noexcept {
    return (static_cast<std::size_t>(y) * width + x) * channels + c;
  }
};

} // namespace vidseal

#endif // VIDSEAL_FRAME_H
