#ifndef VIDSEAL_LATEST_FRAME_SLOT_H
#define VIDSEAL_LATEST_FRAME_SLOT_H

#include "fingerprint/frame.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace vidseal {

/**
 * @brief Single-value broadcast of the most recent delivered frame.
 *
 * Latest value wins: readers that poll faster than the producer see the same
 * version again, slower readers skip versions. The producer only ever holds
 * the lock for a pointer swap.
 */
class LatestFrameSlot {
public:
  struct Snapshot {
    std::uint64_t version{0};
    std::shared_ptr<const Frame> frame;
  };

  void publish(Frame frame);

  /** Current frame, nullptr before the first publish. */
  std::shared_ptr<const Frame> latest() const;

  /** Number of publishes so far. */
  std::uint64_t version() const;

  /**
   * @brief Block until a version newer than @p lastSeen exists or
   * @p timeout expires, then return the current value.
   */
  Snapshot waitForNewer(std::uint64_t lastSeen,
                        std::chrono::milliseconds timeout) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::shared_ptr<const Frame> frame_;
  std::uint64_t version_ = 0;
};

} // namespace vidseal

#endif // VIDSEAL_LATEST_FRAME_SLOT_H
