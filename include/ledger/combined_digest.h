#ifndef VIDSEAL_COMBINED_DIGEST_H
#define VIDSEAL_COMBINED_DIGEST_H

#include "fingerprint/fingerprint.h"

#include <memory>
#include <string>

namespace vidseal {

class DigestBuilder;
class FrameLedger;

/// What a session-level digest is computed over. Never mixed in one deployment.
enum class AggregationMode {
  Fingerprints, ///< little-endian int32 values of every fingerprint
  DigestStrings ///< the 64-char hex digest of every frame
};

/**
 * @brief Session digest over every record of @p ledger in frame id order.
 * @throw MissingFingerprintError in Fingerprints mode if a record has none.
 */
std::string combineLedger(const FrameLedger &ledger,
                          AggregationMode mode = AggregationMode::Fingerprints);

/**
 * @brief Incremental session digest fed one frame at a time.
 *
 * Frames must be added in ascending frame id order.
 */
class CombinedDigestBuilder {
public:
  explicit CombinedDigestBuilder(
      AggregationMode mode = AggregationMode::Fingerprints);
  ~CombinedDigestBuilder();

  CombinedDigestBuilder(const CombinedDigestBuilder &) = delete;
  CombinedDigestBuilder &operator=(const CombinedDigestBuilder &) = delete;

  void add(const Fingerprint &fingerprint, const std::string &digest);

  /** @throw std::logic_error if called twice. */
  std::string finalizeHex();

  AggregationMode mode() const { return mode_; }

private:
  AggregationMode mode_;
  std::unique_ptr<DigestBuilder> builder_;
};

struct CombinedComparison {
  std::string digestA;
  std::string digestB;
  bool equal{false};
};

/** Combine both ledgers with @p mode and compare the results. */
CombinedComparison compareCombined(const FrameLedger &a, const FrameLedger &b,
                                   AggregationMode mode = AggregationMode::Fingerprints);

} // namespace vidseal

#endif // VIDSEAL_COMBINED_DIGEST_H
