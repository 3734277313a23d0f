#include "ledger/combined_digest.h"
#include "ledger/frame_ledger.h"
#include "utilities/digest.hpp"
#include "utilities/errors.hpp"

namespace vidseal {

CombinedDigestBuilder::CombinedDigestBuilder(AggregationMode mode)
    : mode_(mode), builder_(std::make_unique<DigestBuilder>()) {}

CombinedDigestBuilder::~CombinedDigestBuilder() = default;

void CombinedDigestBuilder::add(const Fingerprint &fingerprint,
                                const std::string &digest) {
  if (mode_ == AggregationMode::Fingerprints) {
    builder_->ingestFingerprint(fingerprint);
  } else {
    builder_->ingest(digest);
  }
}

std::string CombinedDigestBuilder::finalizeHex() {
  return builder_->finalizeHex();
}

std::string combineLedger(const FrameLedger &ledger, AggregationMode mode) {
  CombinedDigestBuilder builder(mode);
  for (const auto &rec : ledger.records()) {
    if (mode == AggregationMode::Fingerprints && !rec.fingerprint) {
      throwLogged<MissingFingerprintError>(rec.frameId);
    }
    builder.add(rec.fingerprint ? *rec.fingerprint : Fingerprint{}, rec.digest);
  }
  return builder.finalizeHex();
}

CombinedComparison compareCombined(const FrameLedger &a, const FrameLedger &b,
                                   AggregationMode mode) {
  CombinedComparison result;
  result.digestA = combineLedger(a, mode);
  result.digestB = combineLedger(b, mode);
  result.equal = result.digestA == result.digestB;
  return result;
}

} // namespace vidseal
