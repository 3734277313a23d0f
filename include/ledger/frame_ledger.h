#ifndef VIDSEAL_FRAME_LEDGER_H
#define VIDSEAL_FRAME_LEDGER_H

#include "fingerprint/fingerprint.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vidseal {

/**
 * @brief Per-frame entry of a ledger.
 */
struct FrameRecord {
  std::uint64_t frameId{0};
  std::string timestamp;                  ///< Wall clock or "frame_<n>"
  std::string digest;                     ///< 64 lowercase hex characters
  std::optional<Fingerprint> fingerprint; ///< Kept only when requested
};

/**
 * @brief Append-only record store of one session, keyed by frame id.
 *
 * Once finalized the ledger rejects further appends. Not internally
 * synchronized; the owning session serializes access.
 */
class FrameLedger {
public:
  FrameLedger() = default;

  /**
   * @brief Add a record.
   * @throw DuplicateFrameIdError if @p frameId is already present.
   * @throw SessionClosedError after finalize().
   * @throw std::invalid_argument if @p digest is not a hex SHA-256.
   */
  void append(std::uint64_t frameId, const std::string &timestamp,
              const std::string &digest,
              std::optional<Fingerprint> fingerprint = std::nullopt);

  std::optional<FrameRecord> get(std::uint64_t frameId) const;

  /** Record with the greatest frame id, if any. */
  std::optional<FrameRecord> latest() const;

  bool contains(std::uint64_t frameId) const;
  size_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }

  /** All records in ascending frame id order. */
  std::vector<FrameRecord> records() const;

  std::vector<std::uint64_t> frameIds() const;

  /** True if non-empty and every record carries a fingerprint. */
  bool hasAllFingerprints() const;

  /**
   * @brief Close the ledger and return an immutable copy of it.
   *
   * Calling it again returns another snapshot of the same content.
   */
  std::shared_ptr<const FrameLedger> finalize();

  bool isFinalized() const { return finalized_; }

  /** Build an already-closed ledger. @throw DuplicateFrameIdError */
  static FrameLedger finalized(const std::vector<FrameRecord> &records);

private:
  std::map<std::uint64_t, FrameRecord> records_;
  bool finalized_ = false;
};

} // namespace vidseal

#endif // VIDSEAL_FRAME_LEDGER_H
