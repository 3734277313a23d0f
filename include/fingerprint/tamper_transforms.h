#ifndef VIDSEAL_TAMPER_TRANSFORMS_H
#define VIDSEAL_TAMPER_TRANSFORMS_H

#include "fingerprint/frame.h"

#include <array>
#include <cstdint>
#include <functional>
#include <vector>

namespace vidseal {

/// Pixel rectangle; x/y are the top-left column/row.
struct Rect {
  std::uint32_t x{0};
  std::uint32_t y{0};
  std::uint32_t w{0};
  std::uint32_t h{0};
};

/// Colour in OpenCV channel order.
using Bgr = std::array<std::uint8_t, 3>;

inline constexpr Bgr kMarkerRed{0, 0, 255};

/// Decides which frame ids receive a tamper transform.
using TamperPolicy = std::function<bool(std::uint64_t frameId)>;

/// Deterministic in-place modification of the delivered copy of a frame.
using TamperTransform = std::function<void(Frame &, std::uint64_t frameId)>;

/** Select every n-th frame, never frame 0. n == 0 selects nothing. */
TamperPolicy everyNthFrame(std::uint64_t n = 5);

TamperPolicy neverTamper();

/** Rotate the rows of @p region down by one, the last row wrapping to the top. */
TamperTransform rowRollTransform(Rect region = {100, 100, 20, 20});

/** XOR every byte inside @p region with 1. */
TamperTransform lsbFlipTransform(Rect region = {50, 50, 20, 20});

/** Overwrite every byte inside @p region with @p value. */
TamperTransform regionFillTransform(Rect region, std::uint8_t value);

/** Replace every byte b inside @p region with 255 - b. */
TamperTransform regionInvertTransform(Rect region);

/**
 * @brief Run @p inner, then draw a 1-px outline around @p region.
 *
 * The outline spans columns x..x+w and rows y..y+h inclusive.
 */
TamperTransform outlineMarker(TamperTransform inner, Rect region,
                              Bgr colour = kMarkerRed);

/** Row roll and LSB flip, outlined in red when @p visualMarkers is set. */
std::vector<TamperTransform> defaultTransforms(bool visualMarkers);

/**
 * @brief Paint the "tampered" badge on a delivered frame.
 *
 * Applied after hashing, so it never influences digests.
 */
void stampTamperBadge(Frame &frame);

} // namespace vidseal

#endif // VIDSEAL_TAMPER_TRANSFORMS_H
