#include "utilities/digest.hpp"

#include <stdexcept>

namespace vidseal {

namespace {

void ensureSodium() {
  // sodium_init() returns 0 on success, 1 if already initialized.
  static const int rc = sodium_init();
  if (rc < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

} // namespace

DigestBuilder::DigestBuilder() {
  ensureSodium();
  crypto_hash_sha256_init(&state_);
}

void DigestBuilder::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error("Cannot ingest data after finalize() has been called.");
  }
  if (data && size > 0) {
    crypto_hash_sha256_update(
        &state_, reinterpret_cast<const unsigned char *>(data), size);
  }
}

void DigestBuilder::ingest(const std::string &data) {
  ingest(reinterpret_cast<const std::byte *>(data.data()), data.size());
}

void DigestBuilder::ingestInt32(std::int32_t value) {
  const auto u = static_cast<std::uint32_t>(value);
  const std::byte le[4] = {
      static_cast<std::byte>(u & 0xFFu),
      static_cast<std::byte>((u >> 8) & 0xFFu),
      static_cast<std::byte>((u >> 16) & 0xFFu),
      static_cast<std::byte>((u >> 24) & 0xFFu),
  };
  ingest(le, sizeof(le));
}

void DigestBuilder::ingestFingerprint(const Fingerprint &fingerprint) {
  for (std::int32_t v : fingerprint) {
    ingestInt32(v);
  }
}

DigestArray DigestBuilder::finalize() {
  if (finalized_) {
    throw std::logic_error("finalize() already called.");
  }
  DigestArray out{};
  crypto_hash_sha256_final(&state_, out.data());
  finalized_ = true;
  return out;
}

std::string DigestBuilder::finalizeHex() { return toHex(finalize()); }

std::string toHex(const DigestArray &digest) {
  static const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(DIGEST_HEX_LENGTH);
  for (uint8_t b : digest) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

bool isDigestHex(const std::string &value) {
  if (value.size() != DIGEST_HEX_LENGTH)
    return false;
  for (char c : value) {
    bool digit = c >= '0' && c <= '9';
    bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower)
      return false;
  }
  return true;
}

std::string digestFingerprint(const Fingerprint &fingerprint) {
  DigestBuilder b;
  b.ingestFingerprint(fingerprint);
  return b.finalizeHex();
}

std::string digestString(const std::string &data) {
  DigestBuilder b;
  b.ingest(data);
  return b.finalizeHex();
}

} // namespace vidseal
