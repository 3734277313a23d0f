#include "ledger/ledger_store.h"
#include "utilities/digest.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <filesystem>
#include <fstream>
#include <yaml-cpp/yaml.h>

namespace vidseal {

namespace {

std::uint64_t parseFrameKey(const std::string &path, const std::string &key) {
  std::string digits = key;
  const std::string prefix = "frame_";
  if (digits.compare(0, prefix.size(), prefix) == 0)
    digits = digits.substr(prefix.size());
  if (digits.empty() ||
      digits.find_first_not_of("0123456789") != std::string::npos) {
    throw LedgerIOError(path, "invalid frame key '" + key + "'");
  }
  try {
    return std::stoull(digits);
  } catch (const std::out_of_range &) {
    throw LedgerIOError(path, "frame key out of range '" + key + "'");
  }
}

YAML::Node loadDocument(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    throw LedgerIOError(path, "file does not exist");
  }
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw LedgerIOError(path, std::string("parse error: ") + e.what());
  }
  if (root.IsNull()) {
    return YAML::Node(YAML::NodeType::Map);
  }
  if (!root.IsMap()) {
    throw LedgerIOError(path, "top level is not an object");
  }
  return root;
}

Fingerprint readFingerprint(const std::string &path, const YAML::Node &node,
                            const std::string &key) {
  if (!node.IsSequence()) {
    throw LedgerIOError(path, "fingerprint of '" + key + "' is not an array");
  }
  try {
    return node.as<std::vector<std::int32_t>>();
  } catch (const YAML::Exception &e) {
    throw LedgerIOError(path, "fingerprint of '" + key +
                                  "' is not an integer array: " + e.what());
  }
}

FrameRecord readRecord(const std::string &path, const std::string &key,
                       const YAML::Node &value) {
  FrameRecord rec;
  rec.frameId = parseFrameKey(path, key);
  try {
    if (value.IsScalar()) {
      rec.digest = value.as<std::string>();
    } else if (value.IsMap()) {
      if (!value["sha256"]) {
        throw LedgerIOError(path, "record '" + key + "' has no sha256");
      }
      rec.digest = value["sha256"].as<std::string>();
      if (value["timestamp"])
        rec.timestamp = value["timestamp"].as<std::string>();
      if (value["fingerprint"])
        rec.fingerprint = readFingerprint(path, value["fingerprint"], key);
    } else {
      throw LedgerIOError(path, "record '" + key + "' has an unexpected type");
    }
  } catch (const YAML::Exception &e) {
    throw LedgerIOError(path, "record '" + key + "': " + e.what());
  }
  if (!isDigestHex(rec.digest)) {
    throw LedgerIOError(path, "record '" + key + "' has an invalid sha256");
  }
  return rec;
}

} // namespace

void saveLedger(const FrameLedger &ledger, const std::string &path,
                const LedgerSaveOptions &options) {
  YAML::Emitter out;
  out.SetMapFormat(YAML::Flow);
  out.SetSeqFormat(YAML::Flow);
  out.SetStringFormat(YAML::DoubleQuoted);
  out << YAML::BeginMap;
  for (const auto &rec : ledger.records()) {
    out << YAML::Key << std::to_string(rec.frameId) << YAML::Value;
    out << YAML::BeginMap;
    out << YAML::Key << "sha256" << YAML::Value << rec.digest;
    out << YAML::Key << "timestamp" << YAML::Value << rec.timestamp;
    if (options.includeFingerprints && rec.fingerprint) {
      out << YAML::Key << "fingerprint" << YAML::Value << YAML::BeginSeq;
      for (std::int32_t v : *rec.fingerprint)
        out << v;
      out << YAML::EndSeq;
    }
    out << YAML::EndMap;
  }
  out << YAML::EndMap;
  if (!out.good()) {
    throwLogged<LedgerIOError>(path, "emitter error: " + out.GetLastError());
  }

  std::error_code ec;
  const std::filesystem::path target(path);
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      throwLogged<LedgerIOError>(path, "cannot create directory: " +
                                           ec.message());
    }
  }

  const std::string tmp = path + ".tmp";
  {
    std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      throwLogged<LedgerIOError>(path, "cannot open " + tmp + " for writing");
    }
    file << out.c_str() << '\n';
    file.flush();
    if (!file.good()) {
      throwLogged<LedgerIOError>(path, "write to " + tmp + " failed");
    }
  }

  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throwLogged<LedgerIOError>(path, "rename failed");
  }
  Logger::getInstance().log(LogLevel::INFO,
                            "Saved ledger with " +
                                std::to_string(ledger.size()) +
                                " records to " + path);
}

FrameLedger loadLedger(const std::string &path) {
  YAML::Node root = loadDocument(path);
  std::vector<FrameRecord> records;
  records.reserve(root.size());
  for (const auto &kv : root) {
    std::string key;
    try {
      key = kv.first.as<std::string>();
    } catch (const YAML::Exception &e) {
      throw LedgerIOError(path, std::string("invalid key: ") + e.what());
    }
    records.push_back(readRecord(path, key, kv.second));
  }
  try {
    return FrameLedger::finalized(records);
  } catch (const DuplicateFrameIdError &e) {
    throw LedgerIOError(path, e.what());
  }
}

FingerprintMap loadFingerprintMap(const std::string &path) {
  YAML::Node root = loadDocument(path);
  FingerprintMap out;
  for (const auto &kv : root) {
    std::string key;
    try {
      key = kv.first.as<std::string>();
    } catch (const YAML::Exception &e) {
      throw LedgerIOError(path, std::string("invalid key: ") + e.what());
    }
    const std::uint64_t id = parseFrameKey(path, key);
    if (!out.emplace(id, readFingerprint(path, kv.second, key)).second) {
      throw LedgerIOError(path, "duplicate frame key '" + key + "'");
    }
  }
  return out;
}

FrameLedger attachFingerprints(const FrameLedger &ledger,
                               const FingerprintMap &fingerprints) {
  std::vector<FrameRecord> records = ledger.records();
  for (auto &rec : records) {
    auto it = fingerprints.find(rec.frameId);
    if (it != fingerprints.end())
      rec.fingerprint = it->second;
  }
  return FrameLedger::finalized(records);
}

} // namespace vidseal
