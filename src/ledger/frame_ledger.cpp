#include "ledger/frame_ledger.h"
#include "utilities/digest.hpp"
#include "utilities/errors.hpp"

#include <stdexcept>

namespace vidseal {

void FrameLedger::append(std::uint64_t frameId, const std::string &timestamp,
                         const std::string &digest,
                         std::optional<Fingerprint> fingerprint) {
  if (finalized_) {
    throwLogged<SessionClosedError>("Cannot append frame " +
                                    std::to_string(frameId) +
                                    " to a finalized ledger");
  }
  if (!isDigestHex(digest)) {
    throw std::invalid_argument("Frame " + std::to_string(frameId) +
                                ": digest is not a SHA-256 hex string");
  }
  if (records_.count(frameId)) {
    throwLogged<DuplicateFrameIdError>(frameId);
  }
  records_.emplace(frameId, FrameRecord{frameId, timestamp, digest,
                                        std::move(fingerprint)});
}

std::optional<FrameRecord> FrameLedger::get(std::uint64_t frameId) const {
  auto it = records_.find(frameId);
  if (it == records_.end())
    return std::nullopt;
  return it->second;
}

std::optional<FrameRecord> FrameLedger::latest() const {
  if (records_.empty())
    return std::nullopt;
  return records_.rbegin()->second;
}

bool FrameLedger::contains(std::uint64_t frameId) const {
  return records_.count(frameId) != 0;
}

std::vector<FrameRecord> FrameLedger::records() const {
  std::vector<FrameRecord> out;
  out.reserve(records_.size());
  for (const auto &kv : records_)
    out.push_back(kv.second);
  return out;
}

std::vector<std::uint64_t> FrameLedger::frameIds() const {
  std::vector<std::uint64_t> ids;
  ids.reserve(records_.size());
  for (const auto &kv : records_)
    ids.push_back(kv.first);
  return ids;
}

bool FrameLedger::hasAllFingerprints() const {
  if (records_.empty())
    return false;
  for (const auto &kv : records_) {
    if (!kv.second.fingerprint)
      return false;
  }
  return true;
}

std::shared_ptr<const FrameLedger> FrameLedger::finalize() {
  finalized_ = true;
  return std::make_shared<const FrameLedger>(*this);
}

FrameLedger FrameLedger::finalized(const std::vector<FrameRecord> &records) {
  FrameLedger ledger;
  for (const auto &r : records) {
    ledger.append(r.frameId, r.timestamp, r.digest, r.fingerprint);
  }
  ledger.finalized_ = true;
  return ledger;
}

} // namespace vidseal
