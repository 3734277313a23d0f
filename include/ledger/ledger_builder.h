#ifndef VIDSEAL_LEDGER_BUILDER_H
#define VIDSEAL_LEDGER_BUILDER_H

#include "fingerprint/fingerprint.h"
#include "ledger/frame_ledger.h"

namespace vidseal {

class FrameSource;

struct LedgerBuildOptions {
  int gridSize = DEFAULT_GRID_SIZE;
  FingerprintMode mode = FingerprintMode::PlainSum;
  bool keepFingerprints = true;
};

/**
 * @brief Fingerprint every frame of a recorded stream into a finalized ledger.
 *
 * Frames are numbered from 0 in arrival order and stamped "frame_<n>".
 * Frames that cannot be fingerprinted are skipped without consuming an id.
 */
FrameLedger buildLedger(FrameSource &source,
                        const LedgerBuildOptions &options = {});

} // namespace vidseal

#endif // VIDSEAL_LEDGER_BUILDER_H
