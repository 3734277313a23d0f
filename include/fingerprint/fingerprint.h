#ifndef VIDSEAL_FINGERPRINT_H
#define VIDSEAL_FINGERPRINT_H

#include <cstdint>
#include <vector>

namespace vidseal {

/// One signed value per grid cell, row-major. Empty means "not computable".
using Fingerprint = std::vector<std::int32_t>;

/// How a cell's summed channel means become its fingerprint value.
enum class FingerprintMode {
  PlainSum,         ///< truncated sum of channel means
  ModuloConditioned ///< sum kept only if divisible by 33, times 5 if divisible by 5
};

inline constexpr int DEFAULT_GRID_SIZE = 3;

} // namespace vidseal

#endif // VIDSEAL_FINGERPRINT_H
