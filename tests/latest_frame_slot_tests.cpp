#include "session/latest_frame_slot.h"
#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace vidseal;
using namespace std::chrono_literals;

TEST(LatestFrameSlotTest, EmptyBeforeFirstPublish) {
  LatestFrameSlot slot;
  EXPECT_EQ(slot.latest(), nullptr);
  EXPECT_EQ(slot.version(), 0u);
  auto snap = slot.waitForNewer(0, 10ms);
  EXPECT_EQ(snap.version, 0u);
  EXPECT_EQ(snap.frame, nullptr);
}

TEST(LatestFrameSlotTest, LatestValueWins) {
  LatestFrameSlot slot;
  slot.publish(Frame::solid(2, 2, 1, 1));
  slot.publish(Frame::solid(2, 2, 1, 2));
  slot.publish(Frame::solid(2, 2, 1, 3));
  EXPECT_EQ(slot.version(), 3u);
  ASSERT_NE(slot.latest(), nullptr);
  EXPECT_EQ(slot.latest()->pixels[0], 3);
}

TEST(LatestFrameSlotTest, FastReaderSeesRepeats) {
  LatestFrameSlot slot;
  slot.publish(Frame::solid(2, 2, 1, 7));
  auto a = slot.waitForNewer(0, 10ms);
  auto b = slot.waitForNewer(a.version, 20ms); // times out, same value
  EXPECT_EQ(a.version, b.version);
  EXPECT_EQ(a.frame, b.frame);
}

TEST(LatestFrameSlotTest, SnapshotOutlivesReplacement) {
  LatestFrameSlot slot;
  slot.publish(Frame::solid(2, 2, 1, 1));
  auto held = slot.latest();
  slot.publish(Frame::solid(2, 2, 1, 9));
  EXPECT_EQ(held->pixels[0], 1);
  EXPECT_EQ(slot.latest()->pixels[0], 9);
}

TEST(LatestFrameSlotTest, WaiterWakesOnPublish) {
  LatestFrameSlot slot;
  std::thread producer([&] {
    std::this_thread::sleep_for(20ms);
    slot.publish(Frame::solid(1, 1, 1, 42));
  });
  auto snap = slot.waitForNewer(0, 5s);
  producer.join();
  EXPECT_EQ(snap.version, 1u);
  ASSERT_NE(snap.frame, nullptr);
  EXPECT_EQ(snap.frame->pixels[0], 42);
}

TEST(LatestFrameSlotTest, ManyReadersNeverBlockProducer) {
  LatestFrameSlot slot;
  std::atomic<bool> stop{false};
  std::vector<std::thread> readers;
  std::vector<std::uint64_t> seen(8, 0);
  for (size_t i = 0; i < seen.size(); ++i) {
    readers.emplace_back([&, i] {
      std::uint64_t last = 0;
      while (!stop) {
        auto snap = slot.waitForNewer(last, 5ms);
        EXPECT_GE(snap.version, last);
        last = snap.version;
      }
      seen[i] = last;
    });
  }
  for (int n = 0; n < 200; ++n)
    slot.publish(Frame::solid(4, 4, 3, static_cast<std::uint8_t>(n)));
  stop = true;
  for (auto &t : readers)
    t.join();
  EXPECT_EQ(slot.version(), 200u);
  for (auto v : seen)
    EXPECT_LE(v, 200u);
}
