#ifndef VIDSEAL_DIGEST_HPP
#define VIDSEAL_DIGEST_HPP

#include "fingerprint/fingerprint.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <sodium.h>
#include <string>

namespace vidseal {

/// Digest size of SHA-256 (32 bytes).
inline constexpr size_t DIGEST_SIZE = crypto_hash_sha256_BYTES;

/// Length of a hex-encoded digest.
inline constexpr size_t DIGEST_HEX_LENGTH = DIGEST_SIZE * 2;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @brief Streaming SHA-256 over libsodium.
 *
 * Integers are always encoded as 4 little-endian bytes regardless of the host
 * byte order, so digests are portable between machines.
 */
class DigestBuilder {
public:
  DigestBuilder();

  DigestBuilder(const DigestBuilder &) = delete;
  DigestBuilder &operator=(const DigestBuilder &) = delete;

  /** Append raw bytes. @throw std::logic_error after finalize. */
  void ingest(const std::byte *data, size_t size);

  /** Append raw string bytes. */
  void ingest(const std::string &data);

  /** Append one value as 4 little-endian bytes. */
  void ingestInt32(std::int32_t value);

  /** Append every value of @p fingerprint in order. */
  void ingestFingerprint(const Fingerprint &fingerprint);

  /** Finish hashing. @throw std::logic_error if called twice. */
  DigestArray finalize();

  /** finalize() hex-encoded. */
  std::string finalizeHex();

private:
  crypto_hash_sha256_state state_;
  bool finalized_ = false;
};

/** Lowercase hex encoding of a digest. */
std::string toHex(const DigestArray &digest);

/** True if @p value is a 64-character lowercase hex string. */
bool isDigestHex(const std::string &value);

/** SHA-256 of the canonical little-endian encoding of @p fingerprint. */
std::string digestFingerprint(const Fingerprint &fingerprint);

/** SHA-256 of the bytes of @p data. */
std::string digestString(const std::string &data);

} // namespace vidseal

#endif // VIDSEAL_DIGEST_HPP
