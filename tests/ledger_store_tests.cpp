#include "ledger/ledger_store.h"
#include "utilities/digest.hpp"
#include "utilities/errors.hpp"
#include "utilities/var_dir.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

using namespace vidseal;
namespace fs = std::filesystem;

class LedgerStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::path(getVarDir()) / "ledger_store_tests";
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }
  void TearDown() override { fs::remove_all(dir_); }

  std::string path(const std::string &name) const {
    return (dir_ / name).string();
  }

  void writeFile(const std::string &p, const std::string &content) {
    std::ofstream out(p);
    out << content;
  }

  static FrameLedger sample() {
    FrameLedger l;
    for (std::uint64_t i = 0; i < 12; ++i) {
      Fingerprint fp(9, static_cast<std::int32_t>(i * 3));
      fp[0] = -static_cast<std::int32_t>(i);
      l.append(i, "2026-10-19 12:00:" + std::to_string(10 + i),
               digestFingerprint(fp), fp);
    }
    return l;
  }

  fs::path dir_;
};

TEST_F(LedgerStoreTest, RoundTripKeepsIdsDigestsAndTimestamps) {
  FrameLedger original = sample();
  saveLedger(original, path("l.json"));

  FrameLedger loaded = loadLedger(path("l.json"));
  EXPECT_TRUE(loaded.isFinalized());
  ASSERT_EQ(loaded.size(), original.size());
  for (const auto &rec : original.records()) {
    auto got = loaded.get(rec.frameId);
    ASSERT_TRUE(got) << rec.frameId;
    EXPECT_EQ(got->digest, rec.digest);
    EXPECT_EQ(got->timestamp, rec.timestamp);
    EXPECT_FALSE(got->fingerprint) << "fingerprints are opt-in";
  }
}

TEST_F(LedgerStoreTest, RoundTripWithFingerprints) {
  FrameLedger original = sample();
  LedgerSaveOptions opts;
  opts.includeFingerprints = true;
  saveLedger(original, path("fp.json"), opts);

  FrameLedger loaded = loadLedger(path("fp.json"));
  for (const auto &rec : original.records()) {
    auto got = loaded.get(rec.frameId);
    ASSERT_TRUE(got && got->fingerprint);
    EXPECT_EQ(*got->fingerprint, *rec.fingerprint);
  }
}

TEST_F(LedgerStoreTest, WritesNumericOrderAndNoTempFile) {
  saveLedger(sample(), path("order.json"));
  EXPECT_FALSE(fs::exists(path("order.json.tmp")));

  std::ifstream in(path("order.json"));
  std::string text((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  EXPECT_EQ(text.front(), '{');
  // "2" precedes "10" numerically even though it sorts after it as text.
  EXPECT_LT(text.find("\"2\""), text.find("\"10\""));
  EXPECT_NE(text.find("\"sha256\""), std::string::npos);

  YAML::Node doc = YAML::Load(text);
  ASSERT_TRUE(doc.IsMap());
  EXPECT_EQ(doc.size(), 12u);
  EXPECT_TRUE(doc["0"]["timestamp"]);
}

TEST_F(LedgerStoreTest, EmptyLedgerRoundTrips) {
  saveLedger(FrameLedger{}, path("empty.json"));
  EXPECT_TRUE(loadLedger(path("empty.json")).empty());
}

TEST_F(LedgerStoreTest, CreatesMissingDirectories) {
  std::string nested = path("a/b/c/l.json");
  saveLedger(sample(), nested);
  EXPECT_TRUE(fs::exists(nested));
}

TEST_F(LedgerStoreTest, LoadsLegacyLayouts) {
  const std::string d0 = digestString("a");
  const std::string d1 = digestString("b");
  writeFile(path("legacy.json"),
            "{\"frame_0\": \"" + d0 + "\", \"frame_1\": \"" + d1 + "\"}");
  FrameLedger legacy = loadLedger(path("legacy.json"));
  ASSERT_EQ(legacy.size(), 2u);
  EXPECT_EQ(legacy.get(1)->digest, d1);
  EXPECT_EQ(legacy.get(1)->timestamp, "");
}

TEST_F(LedgerStoreTest, LoadErrorsNameThePath) {
  try {
    loadLedger(path("missing.json"));
    FAIL() << "expected LedgerIOError";
  } catch (const LedgerIOError &e) {
    EXPECT_EQ(e.path(), path("missing.json"));
  }

  writeFile(path("broken.json"), "{\"0\": {\"sha256\": ");
  EXPECT_THROW(loadLedger(path("broken.json")), LedgerIOError);

  writeFile(path("badkey.json"),
            "{\"x7\": {\"sha256\": \"" + digestString("a") + "\"}}");
  EXPECT_THROW(loadLedger(path("badkey.json")), LedgerIOError);

  writeFile(path("baddigest.json"), "{\"0\": {\"sha256\": \"abc\"}}");
  EXPECT_THROW(loadLedger(path("baddigest.json")), LedgerIOError);

  writeFile(path("list.json"), "[1, 2, 3]");
  EXPECT_THROW(loadLedger(path("list.json")), LedgerIOError);

  writeFile(path("dup.json"), "{\"0\": \"" + digestString("a") +
                                  "\", \"frame_0\": \"" + digestString("b") +
                                  "\"}");
  EXPECT_THROW(loadLedger(path("dup.json")), LedgerIOError);
}

TEST_F(LedgerStoreTest, SaveFailureThrows) {
  // A regular file where a directory is needed.
  writeFile(path("blocker"), "x");
  EXPECT_THROW(saveLedger(sample(), path("blocker/l.json")), LedgerIOError);
}

TEST_F(LedgerStoreTest, AttachFingerprintsFromDump) {
  const std::string d0 = digestString("a");
  const std::string d1 = digestString("b");
  writeFile(path("l.json"),
            "{\"frame_0\": \"" + d0 + "\", \"frame_1\": \"" + d1 + "\"}");
  writeFile(path("fp.json"),
            "{\"frame_0\": [1, 2, 3], \"frame_1\": [4, 5, 6], \"frame_9\": [0]}");

  FingerprintMap map = loadFingerprintMap(path("fp.json"));
  EXPECT_EQ(map.size(), 3u);
  FrameLedger merged = attachFingerprints(loadLedger(path("l.json")), map);
  EXPECT_TRUE(merged.isFinalized());
  EXPECT_EQ(merged.size(), 2u);
  EXPECT_TRUE(merged.hasAllFingerprints());
  EXPECT_EQ(*merged.get(1)->fingerprint, (Fingerprint{4, 5, 6}));
}
