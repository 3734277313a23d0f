#include "utilities/digest.hpp"
#include <gtest/gtest.h>

using namespace vidseal;

namespace {
const std::string kEmptySha =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
}

TEST(DigestTest, KnownStringVectors) {
  EXPECT_EQ(digestString(""), kEmptySha);
  EXPECT_EQ(digestString("test"),
            "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08");
}

TEST(DigestTest, EmptyFingerprintHashesEmptyInput) {
  EXPECT_EQ(digestFingerprint({}), kEmptySha);
}

TEST(DigestTest, FingerprintUsesLittleEndianInt32) {
  // 0x74736574 is "test" when written as little-endian bytes.
  EXPECT_EQ(digestFingerprint({0x74736574}), digestString("test"));

  std::string bytes = {'\x5a', '\0', '\0', '\0', '\xff', '\xff', '\xff', '\xff'};
  EXPECT_EQ(digestFingerprint({90, -1}), digestString(bytes));
}

TEST(DigestTest, DeterministicAndSensitive) {
  Fingerprint a(9, 90);
  Fingerprint b = a;
  EXPECT_EQ(digestFingerprint(a), digestFingerprint(b));
  EXPECT_EQ(digestFingerprint(a), digestFingerprint(a));
  b[4] = 91;
  EXPECT_NE(digestFingerprint(a), digestFingerprint(b));
  EXPECT_TRUE(isDigestHex(digestFingerprint(a)));
}

TEST(DigestTest, StreamingMatchesOneShot) {
  DigestBuilder builder;
  builder.ingest(std::string("te"));
  builder.ingest(std::string("st"));
  EXPECT_EQ(builder.finalizeHex(), digestString("test"));
}

TEST(DigestTest, FinalizeTwiceThrows) {
  DigestBuilder builder;
  builder.ingestInt32(7);
  builder.finalize();
  EXPECT_THROW(builder.finalize(), std::logic_error);
  EXPECT_THROW(builder.ingestInt32(8), std::logic_error);
}

TEST(DigestTest, IsDigestHex) {
  EXPECT_TRUE(isDigestHex(kEmptySha));
  EXPECT_FALSE(isDigestHex(""));
  EXPECT_FALSE(isDigestHex(kEmptySha.substr(1)));
  std::string upper = kEmptySha;
  upper[0] = 'E';
  EXPECT_FALSE(isDigestHex(upper));
  std::string bad = kEmptySha;
  bad[10] = 'g';
  EXPECT_FALSE(isDigestHex(bad));
}
