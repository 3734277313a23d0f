#ifndef VIDSEAL_SESSION_CONTROLLER_H
#define VIDSEAL_SESSION_CONTROLLER_H

#include "session/divergence_detector.h"
#include "session/frame_io.h"
#include "session/latest_frame_slot.h"
#include "utilities/config.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vidseal {

/**
 * @brief State of one recording: the detector that owns its ledgers plus
 * its timing.
 */
struct RecordingSession {
  std::unique_ptr<OnlineDivergenceDetector> detector;
  std::chrono::steady_clock::time_point startedAt;
  std::chrono::steady_clock::time_point deadline;
  std::optional<std::chrono::steady_clock::time_point> finishedAt;
};

/// Outcome of a finished (or aborted) recording.
struct SessionSummary {
  std::uint64_t framesRecorded{0};
  std::uint64_t framesSkipped{0};
  std::uint64_t paddedFrames{0};
  std::vector<std::uint64_t> tamperedFrameIds;
  std::string inputCombined;
  std::string outputCombined;
  std::shared_ptr<const FrameLedger> inputLedger;
  std::shared_ptr<const FrameLedger> outputLedger;
  bool aborted{false};
  std::string abortReason;
  std::optional<std::string> persistError;
  double elapsedSeconds{0.0};
};

struct LiveStatus {
  std::string inputDigest = "-";
  std::string outputDigest = "-";
  std::optional<std::uint64_t> frameId;
  std::vector<std::uint64_t> tamperedFrameIds;
  bool isRecording{false};
  double elapsedSeconds{0.0};
};

/**
 * @brief Runs at most one recording session at a time on a background
 * capture thread.
 *
 * Each frame is fingerprinted through a fresh OnlineDivergenceDetector,
 * delivered to the sink and published to the latest-frame slot. Sessions
 * last for the requested wall-clock duration: if the source ends early the
 * last delivered frame is replayed until the deadline.
 */
class SessionController {
public:
  using SourceFactory = std::function<std::unique_ptr<FrameSource>()>;
  using SinkFactory = std::function<std::unique_ptr<FrameSink>()>;

  SessionController(RuntimeOptions options, SourceFactory sourceFactory,
                    SinkFactory sinkFactory, LatestFrameSlot &slot);
  ~SessionController();

  SessionController(const SessionController &) = delete;
  SessionController &operator=(const SessionController &) = delete;

  /**
   * @brief Start a session of @p duration (<= 0 uses the configured default).
   * @throw SessionAlreadyActiveError if a session is running.
   */
  void startRecording(std::chrono::milliseconds duration =
                          std::chrono::milliseconds(0));

  /** Block until no session is running. */
  void waitForCompletion();

  bool isRecording() const;
  LiveStatus status() const;
  std::optional<SessionSummary> lastSummary() const;

private:
  void captureLoop(std::shared_ptr<RecordingSession> session);
  DetectorOptions detectorOptions() const;
  void deliver(std::unique_ptr<FrameSink> &sink, const Frame &frame);

  RuntimeOptions options_;
  SourceFactory sourceFactory_;
  SinkFactory sinkFactory_;
  LatestFrameSlot &slot_;

  mutable std::mutex mutex_;
  std::condition_variable done_;
  bool recording_ = false;
  std::shared_ptr<RecordingSession> session_;
  std::optional<SessionSummary> lastSummary_;
  std::thread worker_;
  std::atomic<bool> shutdown_{false};
};

} // namespace vidseal

#endif // VIDSEAL_SESSION_CONTROLLER_H
