#ifndef VIDSEAL_FINGERPRINT_EXTRACTOR_H
#define VIDSEAL_FINGERPRINT_EXTRACTOR_H

#include "fingerprint/fingerprint.h"
#include "fingerprint/frame.h"

namespace vidseal {

/**
 * @brief Compute the grid-mean fingerprint of a frame.
 *
 * The frame is split into gridSize x gridSize cells of
 * (height / gridSize) x (width / gridSize) pixels; trailing rows and columns
 * are dropped. Each cell contributes the truncated sum of its per-channel
 * means, conditioned by @p mode. Values are emitted row-major.
 *
 * Never throws: a malformed frame or grid yields an empty fingerprint.
 */
Fingerprint extractFingerprint(const Frame &frame,
                               int gridSize = DEFAULT_GRID_SIZE,
                               FingerprintMode mode = FingerprintMode::PlainSum);

/**
 * @brief Check that @p frame can be fingerprinted with @p gridSize.
 * @throw MalformedFrameError describing the first problem found.
 */
void validateFrameForGrid(const Frame &frame, int gridSize);

} // namespace vidseal

#endif // VIDSEAL_FINGERPRINT_EXTRACTOR_H
