#include "session/divergence_detector.h"
#include "fingerprint/fingerprint_extractor.h"
#include "utilities/digest.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

namespace vidseal {

OnlineDivergenceDetector::OnlineDivergenceDetector(DetectorOptions options)
    : options_(std::move(options)),
      inputCombined_(options_.aggregationMode),
      outputCombined_(options_.aggregationMode) {}

void OnlineDivergenceDetector::ensureOpen(std::uint64_t frameId) const {
  if (finalized_) {
    throwLogged<SessionClosedError>("Frame " + std::to_string(frameId) +
                                    " arrived after the session was finalized");
  }
}

FrameOutcome OnlineDivergenceDetector::evaluate(std::uint64_t frameId,
                                                const std::string &timestamp,
                                                const Fingerprint &inputFp,
                                                const Fingerprint &outputFp) {
  FrameOutcome outcome;
  outcome.frameId = frameId;
  if (inputFp.empty() || outputFp.empty()) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ensureOpen(frameId);
    }
    Logger::getInstance().log(LogLevel::WARN,
                              "Frame " + std::to_string(frameId) +
                                  " skipped: no fingerprint");
    outcome.skipped = true;
    return outcome;
  }

  outcome.inputDigest = digestFingerprint(inputFp);
  outcome.outputDigest = digestFingerprint(outputFp);
  outcome.tampered = outcome.inputDigest != outcome.outputDigest;

  std::lock_guard<std::mutex> lock(mutex_);
  ensureOpen(frameId);
  if (inputLedger_.contains(frameId) || outputLedger_.contains(frameId)) {
    throwLogged<DuplicateFrameIdError>(frameId);
  }
  // Combined digests and the tampered set are built in arrival order.
  if (status_.frameId && frameId < *status_.frameId) {
    throwLogged<OutOfOrderFrameError>(frameId, *status_.frameId);
  }
  auto keep = [this](const Fingerprint &fp) {
    return options_.keepFingerprints ? std::optional<Fingerprint>(fp)
                                     : std::nullopt;
  };
  inputLedger_.append(frameId, timestamp, outcome.inputDigest, keep(inputFp));
  outputLedger_.append(frameId, timestamp, outcome.outputDigest, keep(outputFp));
  inputCombined_.add(inputFp, outcome.inputDigest);
  outputCombined_.add(outputFp, outcome.outputDigest);
  if (outcome.tampered) {
    tampered_.push_back(frameId);
    status_.tamperedFrameIds = tampered_;
  }
  status_.inputDigest = outcome.inputDigest;
  status_.outputDigest = outcome.outputDigest;
  status_.frameId = frameId;
  return outcome;
}

ProcessedFrame OnlineDivergenceDetector::processFrame(
    const Frame &frame, std::uint64_t frameId, const std::string &timestamp) {
  ProcessedFrame result;
  result.output = frame;

  Fingerprint inputFp = extractFingerprint(frame, options_.gridSize,
                                           options_.fingerprintMode);
  bool applied = false;
  if (!options_.transforms.empty() && options_.tamperPolicy &&
      options_.tamperPolicy(frameId)) {
    const auto &transform =
        options_.transforms[frameId % options_.transforms.size()];
    transform(result.output, frameId);
    applied = true;
  }
  Fingerprint outputFp = extractFingerprint(result.output, options_.gridSize,
                                            options_.fingerprintMode);

  result.outcome = evaluate(frameId, timestamp, inputFp, outputFp);
  result.outcome.tamperApplied = applied;

  if (result.outcome.tampered) {
    Logger::getInstance().log(LogLevel::WARN, "Tampering detected on frame " +
                                                  std::to_string(frameId));
    if (options_.visualMarkers)
      stampTamperBadge(result.output);
  } else if (applied && !result.outcome.skipped) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Transform on frame " + std::to_string(frameId) +
                                  " left the fingerprint unchanged");
  }
  return result;
}

DetectorStatus OnlineDivergenceDetector::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

std::vector<std::uint64_t> OnlineDivergenceDetector::tamperedFrames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tampered_;
}

size_t OnlineDivergenceDetector::frameCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return inputLedger_.size();
}

DetectorResult OnlineDivergenceDetector::finalize() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finalized_) {
    throwLogged<SessionClosedError>("Detector already finalized");
  }
  finalized_ = true;
  DetectorResult result;
  result.inputLedger = inputLedger_.finalize();
  result.outputLedger = outputLedger_.finalize();
  result.tamperedFrameIds = tampered_;
  result.inputCombined = inputCombined_.finalizeHex();
  result.outputCombined = outputCombined_.finalizeHex();
  return result;
}

} // namespace vidseal
