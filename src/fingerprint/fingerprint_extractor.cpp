#include "fingerprint/fingerprint_extractor.h"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <optional>
#include <string>

namespace vidseal {

namespace {

std::optional<std::string> frameProblem(const Frame &frame, int gridSize) {
  if (gridSize <= 0)
    return "grid size must be positive, got " + std::to_string(gridSize);
  if (frame.height == 0 || frame.width == 0 || frame.channels == 0)
    return "zero-sized dimension (" + std::to_string(frame.height) + "x" +
           std::to_string(frame.width) + "x" + std::to_string(frame.channels) +
           ")";
  if (frame.pixels.size() != frame.bytes())
    return "buffer holds " + std::to_string(frame.pixels.size()) +
           " bytes, expected " + std::to_string(frame.bytes());
  const auto g = static_cast<std::uint32_t>(gridSize);
  if (frame.height / g == 0 || frame.width / g == 0)
    return "frame " + std::to_string(frame.height) + "x" +
           std::to_string(frame.width) + " is smaller than a " +
           std::to_string(gridSize) + "x" + std::to_string(gridSize) + " grid";
  return std::nullopt;
}

std::int32_t conditionCell(std::int32_t v, FingerprintMode mode) {
  if (mode == FingerprintMode::PlainSum)
    return v;
  std::int32_t c = 0;
  if (v % 3 == 0 && v % 11 == 0)
    c += v;
  if (v % 5 == 0)
    c *= 5;
  return c;
}

} // namespace

void validateFrameForGrid(const Frame &frame, int gridSize) {
  if (auto problem = frameProblem(frame, gridSize)) {
    throw MalformedFrameError(*problem);
  }
}

Fingerprint extractFingerprint(const Frame &frame, int gridSize,
                               FingerprintMode mode) {
  if (auto problem = frameProblem(frame, gridSize)) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Cannot fingerprint frame: " + *problem);
    return {};
  }

  const auto g = static_cast<std::uint32_t>(gridSize);
  const std::uint32_t cellH = frame.height / g;
  const std::uint32_t cellW = frame.width / g;
  const std::uint32_t channels = frame.channels;
  const double cellPixels = static_cast<double>(cellH) * cellW;

  Fingerprint fp;
  fp.reserve(static_cast<size_t>(g) * g);
  std::vector<std::uint64_t> sums(channels);

  for (std::uint32_t gy = 0; gy < g; ++gy) {
    for (std::uint32_t gx = 0; gx < g; ++gx) {
      std::fill(sums.begin(), sums.end(), 0);
      for (std::uint32_t y = gy * cellH; y < (gy + 1) * cellH; ++y) {
        for (std::uint32_t x = gx * cellW; x < (gx + 1) * cellW; ++x) {
          for (std::uint32_t c = 0; c < channels; ++c) {
            sums[c] += frame.at(y, x, c);
          }
        }
      }
      double total = 0.0;
      for (std::uint64_t s : sums) {
        total += static_cast<double>(s) / cellPixels;
      }
      fp.push_back(conditionCell(static_cast<std::int32_t>(total), mode));
    }
  }
  return fp;
}

} // namespace vidseal
