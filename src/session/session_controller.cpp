#include "session/session_controller.h"
#include "ledger/ledger_store.h"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/timestamp.hpp"
#include "utilities/var_dir.hpp"

#include <algorithm>

namespace vidseal {

namespace {

using Clock = std::chrono::steady_clock;

double secondsBetween(Clock::time_point from, Clock::time_point to) {
  return std::chrono::duration<double>(to - from).count();
}

} // namespace

SessionController::SessionController(RuntimeOptions options,
                                     SourceFactory sourceFactory,
                                     SinkFactory sinkFactory,
                                     LatestFrameSlot &slot)
    : options_(std::move(options)), sourceFactory_(std::move(sourceFactory)),
      sinkFactory_(std::move(sinkFactory)), slot_(slot) {
  validateRuntimeOptions(options_);
}

SessionController::~SessionController() {
  shutdown_ = true;
  if (worker_.joinable())
    worker_.join();
}

DetectorOptions SessionController::detectorOptions() const {
  DetectorOptions d;
  d.gridSize = options_.gridSize;
  d.fingerprintMode = options_.fingerprintMode;
  d.aggregationMode = options_.aggregationMode;
  d.keepFingerprints = options_.persistFingerprints;
  d.visualMarkers = options_.visualMarkers;
  if (options_.tamperEveryN > 0) {
    d.tamperPolicy =
        everyNthFrame(static_cast<std::uint64_t>(options_.tamperEveryN));
    d.transforms = defaultTransforms(options_.visualMarkers);
  } else {
    d.tamperPolicy = neverTamper();
  }
  return d;
}

void SessionController::startRecording(std::chrono::milliseconds duration) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (recording_) {
    throwLogged<SessionAlreadyActiveError>();
  }
  // The previous capture thread has already cleared recording_ and is exiting.
  if (worker_.joinable())
    worker_.join();

  if (duration <= std::chrono::milliseconds(0))
    duration = std::chrono::seconds(options_.defaultDurationSeconds);

  auto session = std::make_shared<RecordingSession>();
  session->detector =
      std::make_unique<OnlineDivergenceDetector>(detectorOptions());
  session->startedAt = Clock::now();
  session->deadline = session->startedAt + duration;

  session_ = session;
  recording_ = true;
  MetricsRegistry::instance().incrementCounter("vidseal_sessions_total");
  MetricsRegistry::instance().setGauge("vidseal_session_active", 1);
  Logger::getInstance().log(LogLevel::INFO,
                            "Recording started for " +
                                std::to_string(duration.count()) + " ms");
  worker_ = std::thread(&SessionController::captureLoop, this, session);
}

void SessionController::waitForCompletion() {
  std::unique_lock<std::mutex> lock(mutex_);
  done_.wait(lock, [this] { return !recording_; });
}

bool SessionController::isRecording() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return recording_;
}

std::optional<SessionSummary> SessionController::lastSummary() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lastSummary_;
}

LiveStatus SessionController::status() const {
  std::shared_ptr<RecordingSession> session;
  LiveStatus st;
  Clock::time_point end = Clock::now();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    session = session_;
    st.isRecording = recording_;
    if (session && session->finishedAt)
      end = *session->finishedAt;
  }
  if (!session)
    return st;

  DetectorStatus d = session->detector->status();
  st.inputDigest = d.inputDigest;
  st.outputDigest = d.outputDigest;
  st.frameId = d.frameId;
  st.tamperedFrameIds = d.tamperedFrameIds;
  st.elapsedSeconds = secondsBetween(session->startedAt, end);
  return st;
}

void SessionController::deliver(std::unique_ptr<FrameSink> &sink,
                                const Frame &frame) {
  if (sink) {
    try {
      sink->write(frame);
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::ERROR,
                                std::string("Frame sink failed, dropping it: ") +
                                    e.what());
      sink.reset();
    }
  }
  slot_.publish(frame);
}

void SessionController::captureLoop(std::shared_ptr<RecordingSession> session) {
  OnlineDivergenceDetector &detector = *session->detector;
  auto &metrics = MetricsRegistry::instance();
  const auto interval = std::chrono::duration_cast<Clock::duration>(
      std::chrono::duration<double>(1.0 / options_.targetFps));

  std::unique_ptr<FrameSource> source;
  std::unique_ptr<FrameSink> sink;
  try {
    if (sourceFactory_)
      source = sourceFactory_();
    if (sinkFactory_)
      sink = sinkFactory_();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              std::string("Cannot open capture devices: ") +
                                  e.what());
  }
  if (!source) {
    Logger::getInstance().log(LogLevel::ERROR, "Frame source unavailable");
  }

  SessionSummary summary;
  std::optional<Frame> lastOutput;
  std::uint64_t nextId = 0;

  while (source && !shutdown_ && Clock::now() < session->deadline) {
    const auto tick = Clock::now();
    if (!source->isOpen()) {
      Logger::getInstance().log(LogLevel::WARN, "Frame source closed");
      break;
    }
    try {
      std::optional<Frame> frame = source->next();
      if (!frame) {
        Logger::getInstance().log(LogLevel::INFO, "Frame source exhausted");
        break;
      }
      ProcessedFrame pf = detector.processFrame(*frame, nextId, wallClockNow());
      if (pf.outcome.skipped) {
        ++summary.framesSkipped;
      } else {
        ++nextId;
        metrics.incrementCounter("vidseal_frames_total", 1.0,
                                 {{"stream", "input"}});
        metrics.incrementCounter("vidseal_frames_total", 1.0,
                                 {{"stream", "output"}});
        if (pf.outcome.tampered)
          metrics.incrementCounter("vidseal_tampered_frames_total");
      }
      deliver(sink, pf.output);
      lastOutput = std::move(pf.output);
    } catch (const DuplicateFrameIdError &e) {
      summary.aborted = true;
      summary.abortReason = e.what();
      break;
    } catch (const OutOfOrderFrameError &e) {
      summary.aborted = true;
      summary.abortReason = e.what();
      break;
    } catch (const SessionClosedError &e) {
      summary.aborted = true;
      summary.abortReason = e.what();
      break;
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::ERROR,
                                std::string("Frame source failed: ") + e.what());
      break;
    }
    std::this_thread::sleep_until(std::min(tick + interval, session->deadline));
  }

  if (!summary.aborted && lastOutput) {
    while (!shutdown_ && Clock::now() < session->deadline) {
      const auto tick = Clock::now();
      deliver(sink, *lastOutput);
      ++summary.paddedFrames;
      std::this_thread::sleep_until(
          std::min(tick + interval, session->deadline));
    }
    if (summary.paddedFrames > 0) {
      metrics.incrementCounter("vidseal_padded_frames_total",
                               static_cast<double>(summary.paddedFrames));
      Logger::logf(LogLevel::INFO, "Padded session with %llu replayed frames",
                   static_cast<unsigned long long>(summary.paddedFrames));
    }
  }

  summary.framesRecorded = detector.frameCount();
  if (summary.aborted) {
    summary.tamperedFrameIds = detector.tamperedFrames();
    Logger::getInstance().log(LogLevel::ERROR,
                              "Recording aborted: " + summary.abortReason);
  } else {
    DetectorResult result = detector.finalize();
    summary.tamperedFrameIds = result.tamperedFrameIds;
    summary.inputCombined = result.inputCombined;
    summary.outputCombined = result.outputCombined;
    summary.inputLedger = result.inputLedger;
    summary.outputLedger = result.outputLedger;

    LedgerSaveOptions save;
    save.includeFingerprints = options_.persistFingerprints;
    try {
      saveLedger(*result.inputLedger, inputLedgerPath(), save);
      saveLedger(*result.outputLedger, outputLedgerPath(), save);
    } catch (const LedgerIOError &e) {
      summary.persistError = e.what();
    }
    Logger::logf(LogLevel::INFO,
                 "Recording finished: %llu frames, %zu tampered",
                 static_cast<unsigned long long>(summary.framesRecorded),
                 summary.tamperedFrameIds.size());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    session->finishedAt = Clock::now();
    summary.elapsedSeconds =
        secondsBetween(session->startedAt, *session->finishedAt);
    lastSummary_ = summary;
    metrics.setGauge("vidseal_session_active", 0);
    recording_ = false;
  }
  done_.notify_all();
}

} // namespace vidseal
