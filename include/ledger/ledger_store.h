#ifndef VIDSEAL_LEDGER_STORE_H
#define VIDSEAL_LEDGER_STORE_H

#include "ledger/frame_ledger.h"

#include <cstdint>
#include <map>
#include <string>

namespace vidseal {

struct LedgerSaveOptions {
  /// Emit a "fingerprint" array for records that carry one.
  bool includeFingerprints = false;
};

/**
 * @brief Persist @p ledger as a JSON object keyed by decimal frame id.
 *
 * Layout: {"<id>": {"sha256": "...", "timestamp": "...", "fingerprint": [...]}}
 * with keys in ascending numeric order. The document is written to
 * "<path>.tmp" and renamed into place; missing parent directories are
 * created.
 *
 * @throw LedgerIOError if the file cannot be written.
 */
void saveLedger(const FrameLedger &ledger, const std::string &path,
                const LedgerSaveOptions &options = {});

/**
 * @brief Read a ledger written by saveLedger() or by the legacy analyzer.
 *
 * Keys may be "<id>" or "frame_<id>"; values may be record objects or bare
 * digest strings. The returned ledger is finalized.
 *
 * @throw LedgerIOError on a missing file, parse error, bad key or bad digest.
 */
FrameLedger loadLedger(const std::string &path);

using FingerprintMap = std::map<std::uint64_t, Fingerprint>;

/**
 * @brief Read a {"<id>"|"frame_<id>": [ints]} fingerprint dump.
 * @throw LedgerIOError
 */
FingerprintMap loadFingerprintMap(const std::string &path);

/**
 * @brief Copy of @p ledger with fingerprints from @p fingerprints attached.
 *
 * Ids absent from the ledger are ignored. The result is finalized.
 */
FrameLedger attachFingerprints(const FrameLedger &ledger,
                               const FingerprintMap &fingerprints);

} // namespace vidseal

#endif // VIDSEAL_LEDGER_STORE_H
