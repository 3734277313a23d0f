#ifndef VIDSEAL_DIVERGENCE_DETECTOR_H
#define VIDSEAL_DIVERGENCE_DETECTOR_H

#include "fingerprint/fingerprint.h"
#include "fingerprint/frame.h"
#include "fingerprint/tamper_transforms.h"
#include "ledger/combined_digest.h"
#include "ledger/frame_ledger.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vidseal {

struct DetectorOptions {
  int gridSize = DEFAULT_GRID_SIZE;
  FingerprintMode fingerprintMode = FingerprintMode::PlainSum;
  AggregationMode aggregationMode = AggregationMode::Fingerprints;
  bool keepFingerprints = true; ///< store fingerprints in both ledgers
  bool visualMarkers = true;    ///< stamp a badge on tampered output frames
  TamperPolicy tamperPolicy = neverTamper();
  std::vector<TamperTransform> transforms;
};

/// Per-frame result of an input/output comparison.
struct FrameOutcome {
  std::uint64_t frameId{0};
  std::string inputDigest;
  std::string outputDigest;
  bool tampered{false};      ///< digests differ
  bool tamperApplied{false}; ///< a transform was run on the output copy
  bool skipped{false};       ///< a fingerprint could not be computed
};

struct ProcessedFrame {
  FrameOutcome outcome;
  Frame output; ///< delivered copy, possibly transformed and badged
};

/// Online view polled by status consumers.
struct DetectorStatus {
  std::string inputDigest = "-";
  std::string outputDigest = "-";
  std::optional<std::uint64_t> frameId;
  std::vector<std::uint64_t> tamperedFrameIds;
};

struct DetectorResult {
  std::shared_ptr<const FrameLedger> inputLedger;
  std::shared_ptr<const FrameLedger> outputLedger;
  std::vector<std::uint64_t> tamperedFrameIds;
  std::string inputCombined;
  std::string outputCombined;
};

/**
 * @brief Compares the input and delivered fingerprints of every frame of a
 * session and tracks the frames whose digests diverge.
 *
 * Owns both ledgers, the tampered set and the incremental combined digests;
 * one mutex guards them. Fingerprinting and hashing run outside the lock.
 */
class OnlineDivergenceDetector {
public:
  explicit OnlineDivergenceDetector(DetectorOptions options = {});

  /**
   * @brief Digest both fingerprints and record them under @p frameId.
   *
   * If either fingerprint is empty nothing is recorded and the outcome is
   * marked skipped. Frame ids must be recorded in ascending order.
   *
   * @throw DuplicateFrameIdError if @p frameId was already evaluated.
   * @throw OutOfOrderFrameError if @p frameId is below the last recorded id.
   * @throw SessionClosedError after finalize(), skipped frames included.
   */
  FrameOutcome evaluate(std::uint64_t frameId, const std::string &timestamp,
                        const Fingerprint &inputFp, const Fingerprint &outputFp);

  /**
   * @brief Fingerprint @p frame, derive the delivered copy (tampering it if
   * the policy selects @p frameId) and evaluate the pair.
   */
  ProcessedFrame processFrame(const Frame &frame, std::uint64_t frameId,
                              const std::string &timestamp);

  DetectorStatus status() const;
  std::vector<std::uint64_t> tamperedFrames() const;

  /** Number of frames recorded so far. */
  size_t frameCount() const;

  /**
   * @brief Close both ledgers and compute the session digests.
   * @throw SessionClosedError if already finalized.
   */
  DetectorResult finalize();

  const DetectorOptions &options() const { return options_; }

private:
  void ensureOpen(std::uint64_t frameId) const;

  DetectorOptions options_;

  mutable std::mutex mutex_;
  FrameLedger inputLedger_;
  FrameLedger outputLedger_;
  std::vector<std::uint64_t> tampered_;
  CombinedDigestBuilder inputCombined_;
  CombinedDigestBuilder outputCombined_;
  DetectorStatus status_;
  bool finalized_ = false;
};

} // namespace vidseal

#endif // VIDSEAL_DIVERGENCE_DETECTOR_H
