#ifndef VIDSEAL_BATCH_COMPARATOR_H
#define VIDSEAL_BATCH_COMPARATOR_H

#include "ledger/frame_ledger.h"

#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace vidseal {

enum class Classification { Authentic, Tampered };

std::string toString(Classification c);

struct ComparatorOptions {
  int tolerance = 10;          ///< max per-cell absolute difference
  double thresholdRatio = 0.1; ///< max share of differing frames
};

struct Verdict {
  Classification classification{Classification::Authentic};
  std::uint64_t differingFrameCount{0};
  std::uint64_t matchedFrameCount{0};
  std::set<std::uint64_t> hashMismatchFrameIds;
  /// (frame id, cells over tolerance); length mismatches report every cell.
  std::vector<std::pair<std::uint64_t, std::uint64_t>> differingFrames;
  std::uint64_t framesWithoutFingerprints{0};
};

/**
 * @brief Compare two independently produced ledgers frame by frame.
 *
 * Only frame ids present in both ledgers are compared. A frame differs when
 * any cell of its fingerprints differs by more than the tolerance (or the
 * fingerprints have different lengths); digest mismatches are collected
 * separately. The result is TAMPERED if the share of differing frames
 * exceeds the threshold or any digest mismatched.
 *
 * @throw NoCommonFramesError if the ledgers share no frame id.
 */
Verdict compareLedgers(const FrameLedger &a, const FrameLedger &b,
                       const ComparatorOptions &options = {});

} // namespace vidseal

#endif // VIDSEAL_BATCH_COMPARATOR_H
