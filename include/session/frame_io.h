#ifndef VIDSEAL_FRAME_IO_H
#define VIDSEAL_FRAME_IO_H

#include "fingerprint/frame.h"

#include <cstdint>
#include <limits>
#include <optional>

namespace vidseal {

/**
 * @brief Producer of raw frames (camera, decoded video file, ...).
 */
class FrameSource {
public:
  virtual ~FrameSource() = default;

  /**
   * @brief Next frame, or nullopt once the source is exhausted.
   * @throw std::runtime_error on a device failure.
   */
  virtual std::optional<Frame> next() = 0;

  virtual bool isOpen() const = 0;
};

/**
 * @brief Consumer of delivered frames (video writer).
 */
class FrameSink {
public:
  virtual ~FrameSink() = default;
  virtual void write(const Frame &frame) = 0;
};

/**
 * @brief Deterministic gradient pattern, used when no camera is available.
 *
 * Pixel (y, x, c) of frame n is (x + 2 * y + 40 * c + n) mod 256.
 */
class TestPatternSource : public FrameSource {
public:
  TestPatternSource(std::uint32_t height, std::uint32_t width,
                    std::uint32_t channels = 3,
                    std::uint64_t maxFrames =
                        std::numeric_limits<std::uint64_t>::max());

  std::optional<Frame> next() override;
  bool isOpen() const override { return produced_ < maxFrames_; }

private:
  std::uint32_t height_;
  std::uint32_t width_;
  std::uint32_t channels_;
  std::uint64_t maxFrames_;
  std::uint64_t produced_ = 0;
};

} // namespace vidseal

#endif // VIDSEAL_FRAME_IO_H
