#ifndef VIDSEAL_ERRORS_HPP
#define VIDSEAL_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace vidseal {

/**
 * @brief Base class for every error raised by the integrity engine.
 */
class VidsealError : public std::runtime_error {
public:
  explicit VidsealError(const std::string &what) : std::runtime_error(what) {}
};

/** A frame could not be fingerprinted (missing, wrong shape, too small). */
class MalformedFrameError : public VidsealError {
public:
  explicit MalformedFrameError(const std::string &reason)
      : VidsealError("Malformed frame: " + reason) {}
};

/** A ledger already holds a record for this frame id. */
class DuplicateFrameIdError : public VidsealError {
public:
  explicit DuplicateFrameIdError(std::uint64_t frameId)
      : VidsealError("Duplicate frame id " + std::to_string(frameId)),
        frameId_(frameId) {}

  std::uint64_t frameId() const { return frameId_; }

private:
  std::uint64_t frameId_;
};

/** A frame id arrived below the last one a session recorded. */
class OutOfOrderFrameError : public VidsealError {
public:
  OutOfOrderFrameError(std::uint64_t frameId, std::uint64_t lastFrameId)
      : VidsealError("Frame id " + std::to_string(frameId) +
                     " arrived after frame " + std::to_string(lastFrameId)),
        frameId_(frameId) {}

  std::uint64_t frameId() const { return frameId_; }

private:
  std::uint64_t frameId_;
};

/** Append attempted on a ledger or detector that was already finalized. */
class SessionClosedError : public VidsealError {
public:
  explicit SessionClosedError(const std::string &what)
      : VidsealError(what) {}
};

/** Offline comparison was asked to compare two ledgers with no frame in common. */
class NoCommonFramesError : public VidsealError {
public:
  NoCommonFramesError()
      : VidsealError("Ledgers share no frame ids; nothing to compare") {}
};

/** A recording was requested while another one is still running. */
class SessionAlreadyActiveError : public VidsealError {
public:
  SessionAlreadyActiveError()
      : VidsealError("Recording already in progress") {}
};

/** A ledger could not be written to or read from disk. */
class LedgerIOError : public VidsealError {
public:
  LedgerIOError(std::string path, const std::string &reason)
      : VidsealError("Ledger I/O error (" + path + "): " + reason),
        path_(std::move(path)) {}

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

/** Fingerprint aggregation needs a fingerprint the ledger does not carry. */
class MissingFingerprintError : public VidsealError {
public:
  explicit MissingFingerprintError(std::uint64_t frameId)
      : VidsealError("Frame " + std::to_string(frameId) +
                     " has no fingerprint to aggregate") {}
};

/**
 * @brief Log @p error at ERROR level and throw it.
 *
 * Logging failures (logger not initialized, unwritable file) are reported on
 * stderr so the original error is never lost.
 */
void logError(const std::string &message);

template <typename E, typename... Args> [[noreturn]] void throwLogged(Args &&...args) {
  E error(std::forward<Args>(args)...);
  logError(error.what());
  throw error;
}

} // namespace vidseal

#endif // VIDSEAL_ERRORS_HPP
