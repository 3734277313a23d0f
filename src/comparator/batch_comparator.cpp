#include "comparator/batch_comparator.h"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <cstdlib>

namespace vidseal {

std::string toString(Classification c) {
  return c == Classification::Authentic ? "AUTHENTIC" : "TAMPERED";
}

namespace {

std::uint64_t cellsOverTolerance(const Fingerprint &a, const Fingerprint &b,
                                 int tolerance) {
  if (a.size() != b.size())
    return std::max(a.size(), b.size());
  std::uint64_t over = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    std::int64_t diff = static_cast<std::int64_t>(a[i]) - b[i];
    if (std::llabs(diff) > tolerance)
      ++over;
  }
  return over;
}

} // namespace

Verdict compareLedgers(const FrameLedger &a, const FrameLedger &b,
                       const ComparatorOptions &options) {
  Verdict v;
  for (const auto &ra : a.records()) {
    std::optional<FrameRecord> rb = b.get(ra.frameId);
    if (!rb)
      continue;
    ++v.matchedFrameCount;

    if (ra.fingerprint && rb->fingerprint) {
      std::uint64_t over =
          cellsOverTolerance(*ra.fingerprint, *rb->fingerprint, options.tolerance);
      if (over > 0) {
        ++v.differingFrameCount;
        v.differingFrames.emplace_back(ra.frameId, over);
      }
    } else {
      ++v.framesWithoutFingerprints;
    }

    if (ra.digest != rb->digest)
      v.hashMismatchFrameIds.insert(ra.frameId);
  }

  if (v.matchedFrameCount == 0) {
    throwLogged<NoCommonFramesError>();
  }

  const double ratio = static_cast<double>(v.differingFrameCount) /
                       static_cast<double>(v.matchedFrameCount);
  v.classification = (ratio > options.thresholdRatio ||
                      !v.hashMismatchFrameIds.empty())
                         ? Classification::Tampered
                         : Classification::Authentic;

  MetricsRegistry::instance().incrementCounter(
      "vidseal_comparisons_total", 1.0,
      {{"verdict", toString(v.classification)}});
  Logger::logf(LogLevel::INFO,
               "Compared %llu frames: %llu differing, %zu digest mismatches, %s",
               static_cast<unsigned long long>(v.matchedFrameCount),
               static_cast<unsigned long long>(v.differingFrameCount),
               v.hashMismatchFrameIds.size(),
               toString(v.classification).c_str());
  return v;
}

} // namespace vidseal
