#include "fingerprint/tamper_transforms.h"

#include <algorithm>
#include <utility>

namespace vidseal {

namespace {

/// Half-open [y0,y1) x [x0,x1) intersection of a rectangle with the frame.
struct Clip {
  std::uint32_t x0, y0, x1, y1;
  bool empty() const { return x0 >= x1 || y0 >= y1; }
};

Clip clip(const Frame &frame, const Rect &r) {
  auto end = [](std::uint32_t start, std::uint32_t len, std::uint32_t limit) {
    std::uint64_t e = static_cast<std::uint64_t>(start) + len;
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(e, limit));
  };
  Clip c{std::min(r.x, frame.width), std::min(r.y, frame.height),
         end(r.x, r.w, frame.width), end(r.y, r.h, frame.height)};
  return c;
}

template <typename F> void forEachByte(Frame &frame, const Rect &r, F fn) {
  if (!frame.wellFormed())
    return;
  Clip c = clip(frame, r);
  if (c.empty())
    return;
  for (std::uint32_t y = c.y0; y < c.y1; ++y)
    for (std::uint32_t x = c.x0; x < c.x1; ++x)
      for (std::uint32_t ch = 0; ch < frame.channels; ++ch)
        fn(frame.at(y, x, ch));
}

// Single-channel frames take the red component.
void paint(Frame &frame, std::uint32_t y, std::uint32_t x, const Bgr &colour) {
  if (y >= frame.height || x >= frame.width)
    return;
  for (std::uint32_t ch = 0; ch < frame.channels; ++ch) {
    std::uint8_t v = frame.channels >= 3 ? (ch < 3 ? colour[ch] : 255) : colour[2];
    frame.at(y, x, ch) = v;
  }
}

} // namespace

TamperPolicy everyNthFrame(std::uint64_t n) {
  return [n](std::uint64_t frameId) {
    return n > 0 && frameId > 0 && frameId % n == 0;
  };
}

TamperPolicy neverTamper() {
  return [](std::uint64_t) { return false; };
}

TamperTransform rowRollTransform(Rect region) {
  return [region](Frame &frame, std::uint64_t) {
    if (!frame.wellFormed())
      return;
    Clip c = clip(frame, region);
    if (c.empty() || c.y1 - c.y0 < 2)
      return;
    const size_t rowBytes = static_cast<size_t>(c.x1 - c.x0) * frame.channels;
    std::vector<std::uint8_t> last(rowBytes);
    auto rowPtr = [&](std::uint32_t y) { return &frame.at(y, c.x0, 0); };

    std::copy(rowPtr(c.y1 - 1), rowPtr(c.y1 - 1) + rowBytes, last.begin());
    for (std::uint32_t y = c.y1 - 1; y > c.y0; --y) {
      std::copy(rowPtr(y - 1), rowPtr(y - 1) + rowBytes, rowPtr(y));
    }
    std::copy(last.begin(), last.end(), rowPtr(c.y0));
  };
}

TamperTransform lsbFlipTransform(Rect region) {
  return [region](Frame &frame, std::uint64_t) {
    forEachByte(frame, region, [](std::uint8_t &b) { b ^= 1; });
  };
}

TamperTransform regionFillTransform(Rect region, std::uint8_t value) {
  return [region, value](Frame &frame, std::uint64_t) {
    forEachByte(frame, region, [value](std::uint8_t &b) { b = value; });
  };
}

TamperTransform regionInvertTransform(Rect region) {
  return [region](Frame &frame, std::uint64_t) {
    forEachByte(frame, region,
                [](std::uint8_t &b) { b = static_cast<std::uint8_t>(255 - b); });
  };
}

TamperTransform outlineMarker(TamperTransform inner, Rect region, Bgr colour) {
  return [inner = std::move(inner), region, colour](Frame &frame,
                                                     std::uint64_t frameId) {
    if (inner)
      inner(frame, frameId);
    if (!frame.wellFormed())
      return;
    // Outline edges sit on x..x+w and y..y+h inclusive; clamp before looping.
    const std::uint64_t right = static_cast<std::uint64_t>(region.x) + region.w;
    const std::uint64_t bottom = static_cast<std::uint64_t>(region.y) + region.h;
    const std::uint64_t lastX = std::min<std::uint64_t>(right, frame.width - 1);
    const std::uint64_t lastY = std::min<std::uint64_t>(bottom, frame.height - 1);
    for (std::uint64_t x = region.x; x <= lastX; ++x) {
      const auto px = static_cast<std::uint32_t>(x);
      paint(frame, region.y, px, colour);
      if (bottom == lastY)
        paint(frame, static_cast<std::uint32_t>(bottom), px, colour);
    }
    for (std::uint64_t y = region.y; y <= lastY; ++y) {
      const auto py = static_cast<std::uint32_t>(y);
      paint(frame, py, region.x, colour);
      if (right == lastX)
        paint(frame, py, static_cast<std::uint32_t>(right), colour);
    }
  };
}

std::vector<TamperTransform> defaultTransforms(bool visualMarkers) {
  const Rect rollRegion{100, 100, 20, 20};
  const Rect lsbRegion{50, 50, 20, 20};
  std::vector<TamperTransform> out;
  if (visualMarkers) {
    out.push_back(outlineMarker(rowRollTransform(rollRegion), rollRegion));
    out.push_back(outlineMarker(lsbFlipTransform(lsbRegion), lsbRegion));
  } else {
    out.push_back(rowRollTransform(rollRegion));
    out.push_back(lsbFlipTransform(lsbRegion));
  }
  return out;
}

void stampTamperBadge(Frame &frame) {
  if (!frame.wellFormed())
    return;
  const std::uint32_t x = frame.width > 200 ? frame.width - 200 : 0;
  Clip c = clip(frame, Rect{x, 35, 120, 20});
  for (std::uint32_t y = c.y0; y < c.y1; ++y)
    for (std::uint32_t px = c.x0; px < c.x1; ++px)
      paint(frame, y, px, kMarkerRed);
}

} // namespace vidseal
