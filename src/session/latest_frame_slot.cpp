#include "session/latest_frame_slot.h"

namespace vidseal {

void LatestFrameSlot::publish(Frame frame) {
  auto next = std::make_shared<const Frame>(std::move(frame));
  {
    std::lock_guard<std::mutex> lock(mutex_);
    frame_.swap(next);
    ++version_;
  }
  cv_.notify_all();
}

std::shared_ptr<const Frame> LatestFrameSlot::latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frame_;
}

std::uint64_t LatestFrameSlot::version() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return version_;
}

LatestFrameSlot::Snapshot
LatestFrameSlot::waitForNewer(std::uint64_t lastSeen,
                              std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return version_ > lastSeen; });
  return Snapshot{version_, frame_};
}

} // namespace vidseal
