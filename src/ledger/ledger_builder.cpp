#include "ledger/ledger_builder.h"
#include "fingerprint/fingerprint_extractor.h"
#include "session/frame_io.h"
#include "utilities/digest.hpp"
#include "utilities/logger.h"

namespace vidseal {

FrameLedger buildLedger(FrameSource &source, const LedgerBuildOptions &options) {
  FrameLedger ledger;
  std::uint64_t nextId = 0;
  std::uint64_t skipped = 0;

  while (source.isOpen()) {
    std::optional<Frame> frame = source.next();
    if (!frame)
      break;
    Fingerprint fp = extractFingerprint(*frame, options.gridSize, options.mode);
    if (fp.empty()) {
      ++skipped;
      continue;
    }
    const std::string digest = digestFingerprint(fp);
    ledger.append(nextId, "frame_" + std::to_string(nextId), digest,
                  options.keepFingerprints ? std::optional<Fingerprint>(std::move(fp))
                                           : std::nullopt);
    ++nextId;
  }

  Logger::logf(LogLevel::INFO, "Built ledger: %llu frames, %llu skipped",
               static_cast<unsigned long long>(nextId),
               static_cast<unsigned long long>(skipped));
  ledger.finalize();
  return ledger;
}

} // namespace vidseal
