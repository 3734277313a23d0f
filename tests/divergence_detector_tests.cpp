#include "fingerprint/fingerprint_extractor.h"
#include "ledger/combined_digest.h"
#include "session/divergence_detector.h"
#include "session/frame_io.h"
#include "utilities/digest.hpp"
#include "utilities/errors.hpp"
#include <atomic>
#include <gtest/gtest.h>
#include <thread>

using namespace vidseal;

namespace {

DetectorOptions fillEveryFifth(bool markers = false) {
  DetectorOptions opts;
  opts.tamperPolicy = everyNthFrame(5);
  opts.transforms = {regionFillTransform(Rect{0, 0, 30, 30}, 255)};
  opts.visualMarkers = markers;
  return opts;
}

Frame gradientFrame(std::uint32_t h, std::uint32_t w) {
  TestPatternSource src(h, w, 3, 1);
  return *src.next();
}

} // namespace

TEST(DivergenceDetectorTest, FlagsExactlyTheTransformedFrames) {
  OnlineDivergenceDetector detector(fillEveryFifth());
  for (std::uint64_t id = 0; id < 20; ++id) {
    ProcessedFrame pf = detector.processFrame(Frame::solid(90, 90, 3, 30), id,
                                              "frame_" + std::to_string(id));
    EXPECT_EQ(pf.outcome.tamperApplied, id > 0 && id % 5 == 0) << id;
  }
  EXPECT_EQ(detector.tamperedFrames(), (std::vector<std::uint64_t>{5, 10, 15}));
  EXPECT_EQ(detector.frameCount(), 20u);

  DetectorResult result = detector.finalize();
  EXPECT_EQ(result.tamperedFrameIds, (std::vector<std::uint64_t>{5, 10, 15}));
  EXPECT_EQ(result.inputLedger->size(), 20u);
  EXPECT_EQ(result.outputLedger->size(), 20u);
  EXPECT_EQ(result.inputLedger->get(4)->digest, result.outputLedger->get(4)->digest);
  EXPECT_NE(result.inputLedger->get(5)->digest, result.outputLedger->get(5)->digest);
  EXPECT_NE(result.inputCombined, result.outputCombined);
}

TEST(DivergenceDetectorTest, CombinedDigestsMatchFinalLedgers) {
  DetectorOptions opts = fillEveryFifth();
  opts.aggregationMode = AggregationMode::DigestStrings;
  OnlineDivergenceDetector detector(opts);
  for (std::uint64_t id = 0; id < 7; ++id)
    detector.processFrame(gradientFrame(60, 60), id, "t");
  DetectorResult r = detector.finalize();
  EXPECT_EQ(r.inputCombined,
            combineLedger(*r.inputLedger, AggregationMode::DigestStrings));
  EXPECT_EQ(r.outputCombined,
            combineLedger(*r.outputLedger, AggregationMode::DigestStrings));
  EXPECT_TRUE(r.inputLedger->hasAllFingerprints());
}

TEST(DivergenceDetectorTest, RowRollInsideOneCellIsUndetectable) {
  DetectorOptions opts;
  opts.tamperPolicy = everyNthFrame(5);
  opts.transforms = {rowRollTransform(Rect{100, 100, 20, 20})};
  OnlineDivergenceDetector detector(opts);

  // 300x300 gives 100x100 cells; the rolled rows stay inside cell (1,1).
  Frame frame = gradientFrame(300, 300);
  ProcessedFrame pf = detector.processFrame(frame, 5, "t");
  EXPECT_TRUE(pf.outcome.tamperApplied);
  EXPECT_NE(pf.output.pixels, frame.pixels) << "pixels did change";
  EXPECT_FALSE(pf.outcome.tampered);
  EXPECT_TRUE(detector.tamperedFrames().empty());
}

TEST(DivergenceDetectorTest, LsbFlipOnLargeCellIsUndetectable) {
  DetectorOptions opts;
  opts.tamperPolicy = everyNthFrame(5);
  opts.transforms = {lsbFlipTransform(Rect{50, 50, 20, 20})};
  OnlineDivergenceDetector detector(opts);

  ProcessedFrame pf = detector.processFrame(Frame::solid(300, 300, 3, 100), 5, "t");
  EXPECT_TRUE(pf.outcome.tamperApplied);
  EXPECT_FALSE(pf.outcome.tampered);
}

TEST(DivergenceDetectorTest, LsbFlipOnSmallCellIsDetected) {
  DetectorOptions opts;
  opts.gridSize = 18;
  opts.tamperPolicy = everyNthFrame(5);
  opts.transforms = {lsbFlipTransform(Rect{50, 50, 20, 20})};
  OnlineDivergenceDetector detector(opts);

  // 180x180 with grid 18 gives 10x10 cells; the flip covers four whole cells.
  ProcessedFrame pf = detector.processFrame(Frame::solid(180, 180, 3, 100), 10, "t");
  EXPECT_TRUE(pf.outcome.tampered);
}

TEST(DivergenceDetectorTest, BadgeIsStampedAfterHashing) {
  OnlineDivergenceDetector withBadge(fillEveryFifth(true));
  Frame frame = Frame::solid(90, 90, 3, 30);
  ProcessedFrame pf = withBadge.processFrame(frame, 5, "t");
  ASSERT_TRUE(pf.outcome.tampered);

  Frame transformedOnly = frame;
  regionFillTransform(Rect{0, 0, 30, 30}, 255)(transformedOnly, 5);
  EXPECT_NE(pf.output.pixels, transformedOnly.pixels);
  EXPECT_EQ(pf.outcome.outputDigest,
            digestFingerprint(extractFingerprint(transformedOnly)));

  OnlineDivergenceDetector noBadge(fillEveryFifth(false));
  EXPECT_EQ(noBadge.processFrame(frame, 5, "t").output.pixels,
            transformedOnly.pixels);
}

TEST(DivergenceDetectorTest, MalformedFrameIsSkipped) {
  OnlineDivergenceDetector detector;
  ProcessedFrame pf = detector.processFrame(Frame{}, 0, "t");
  EXPECT_TRUE(pf.outcome.skipped);
  EXPECT_EQ(detector.frameCount(), 0u);
  EXPECT_FALSE(detector.status().frameId.has_value());

  FrameOutcome o = detector.evaluate(1, "t", Fingerprint(9, 1), Fingerprint{});
  EXPECT_TRUE(o.skipped);
  EXPECT_EQ(detector.frameCount(), 0u);
}

TEST(DivergenceDetectorTest, LedgerMisuseThrows) {
  OnlineDivergenceDetector detector;
  Fingerprint fp(9, 90);
  detector.evaluate(0, "t", fp, fp);
  EXPECT_THROW(detector.evaluate(0, "t", fp, fp), DuplicateFrameIdError);
  EXPECT_EQ(detector.frameCount(), 1u);

  detector.finalize();
  EXPECT_THROW(detector.evaluate(1, "t", fp, fp), SessionClosedError);
  EXPECT_THROW(detector.finalize(), SessionClosedError);
}

TEST(DivergenceDetectorTest, FrameIdsMustAscend) {
  OnlineDivergenceDetector detector;
  Fingerprint in(9, 90), out(9, 91);
  detector.evaluate(7, "t", in, out);
  EXPECT_THROW(detector.evaluate(3, "t", in, out), OutOfOrderFrameError);
  // Gaps are allowed; ids only have to grow.
  EXPECT_NO_THROW(detector.evaluate(9, "t", in, out));
  EXPECT_EQ(detector.tamperedFrames(), (std::vector<std::uint64_t>{7, 9}));

  OnlineDivergenceDetector second;
  second.evaluate(1, "t", Fingerprint(9, 2), Fingerprint(9, 2));
  EXPECT_THROW(second.evaluate(0, "t", Fingerprint(9, 1), Fingerprint(9, 1)),
               OutOfOrderFrameError);
  DetectorResult r = second.finalize();
  EXPECT_EQ(r.inputLedger->size(), 1u);
  EXPECT_EQ(r.inputCombined, combineLedger(*r.inputLedger));
  EXPECT_EQ(r.outputCombined, combineLedger(*r.outputLedger));
}

TEST(DivergenceDetectorTest, SkippedFrameAfterFinalizeThrows) {
  OnlineDivergenceDetector detector;
  detector.finalize();
  EXPECT_THROW(detector.evaluate(0, "t", Fingerprint{}, Fingerprint(9, 1)),
               SessionClosedError);
  EXPECT_THROW(detector.processFrame(Frame{}, 1, "t"), SessionClosedError);
}

TEST(DivergenceDetectorTest, StatusTracksLatestFrame) {
  OnlineDivergenceDetector detector;
  DetectorStatus before = detector.status();
  EXPECT_EQ(before.inputDigest, "-");
  EXPECT_EQ(before.outputDigest, "-");
  EXPECT_FALSE(before.frameId);

  Fingerprint in(9, 90), out(9, 91);
  FrameOutcome o = detector.evaluate(3, "t", in, out);
  EXPECT_TRUE(o.tampered);
  DetectorStatus st = detector.status();
  EXPECT_EQ(st.inputDigest, digestFingerprint(in));
  EXPECT_EQ(st.outputDigest, digestFingerprint(out));
  ASSERT_TRUE(st.frameId);
  EXPECT_EQ(*st.frameId, 3u);
  EXPECT_EQ(st.tamperedFrameIds, (std::vector<std::uint64_t>{3}));
}

TEST(DivergenceDetectorTest, FingerprintsCanBeDropped) {
  DetectorOptions opts;
  opts.keepFingerprints = false;
  OnlineDivergenceDetector detector(opts);
  detector.evaluate(0, "t", Fingerprint(9, 1), Fingerprint(9, 1));
  DetectorResult r = detector.finalize();
  EXPECT_FALSE(r.inputLedger->get(0)->fingerprint);
  // Combined digests are built incrementally, so they survive.
  DigestBuilder b;
  b.ingestFingerprint(Fingerprint(9, 1));
  EXPECT_EQ(r.inputCombined, b.finalizeHex());
}

TEST(DivergenceDetectorTest, StatusReadableDuringProcessing) {
  OnlineDivergenceDetector detector(fillEveryFifth());
  std::atomic<bool> done{false};
  std::thread reader([&] {
    while (!done) {
      DetectorStatus st = detector.status();
      if (st.frameId) {
        EXPECT_NE(st.inputDigest, "-");
      }
    }
  });
  for (std::uint64_t id = 0; id < 50; ++id)
    detector.processFrame(Frame::solid(90, 90, 3, 30), id, "t");
  done = true;
  reader.join();
  EXPECT_EQ(detector.tamperedFrames().size(), 9u);
}
