#include "utilities/config.hpp"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace vidseal {

FingerprintMode parseFingerprintMode(const std::string &name) {
  if (name == "plain")
    return FingerprintMode::PlainSum;
  if (name == "modulo")
    return FingerprintMode::ModuloConditioned;
  throw std::invalid_argument("Unknown fingerprint_mode '" + name +
                              "' (expected plain|modulo)");
}

AggregationMode parseAggregationMode(const std::string &name) {
  if (name == "fingerprints")
    return AggregationMode::Fingerprints;
  if (name == "digests")
    return AggregationMode::DigestStrings;
  throw std::invalid_argument("Unknown aggregation_mode '" + name +
                              "' (expected fingerprints|digests)");
}

std::string toString(FingerprintMode mode) {
  return mode == FingerprintMode::PlainSum ? "plain" : "modulo";
}

std::string toString(AggregationMode mode) {
  return mode == AggregationMode::Fingerprints ? "fingerprints" : "digests";
}

void validateRuntimeOptions(const RuntimeOptions &opts) {
  if (opts.gridSize <= 0)
    throw std::invalid_argument("grid_size must be positive");
  if (opts.tamperEveryN < 0)
    throw std::invalid_argument("tamper_every_n must not be negative");
  if (opts.tolerance < 0)
    throw std::invalid_argument("tolerance must not be negative");
  if (opts.thresholdRatio < 0.0)
    throw std::invalid_argument("threshold_ratio must not be negative");
  if (opts.targetFps <= 0)
    throw std::invalid_argument("target_fps must be positive");
  if (opts.defaultDurationSeconds <= 0)
    throw std::invalid_argument("default_duration_seconds must be positive");
}

static int envInt(const char *name, const char *value) {
  try {
    return std::stoi(value);
  } catch (const std::exception &) {
    throw std::invalid_argument(std::string(name) + " is not an integer: " +
                                value);
  }
}

static double envDouble(const char *name, const char *value) {
  try {
    return std::stod(value);
  } catch (const std::exception &) {
    throw std::invalid_argument(std::string(name) + " is not a number: " +
                                value);
  }
}

static void applyYaml(RuntimeOptions &opts, const YAML::Node &node) {
  try {
    if (node["grid_size"])
      opts.gridSize = node["grid_size"].as<int>();
    if (node["fingerprint_mode"])
      opts.fingerprintMode =
          parseFingerprintMode(node["fingerprint_mode"].as<std::string>());
    if (node["aggregation_mode"])
      opts.aggregationMode =
          parseAggregationMode(node["aggregation_mode"].as<std::string>());
    if (node["tamper_every_n"])
      opts.tamperEveryN = node["tamper_every_n"].as<int>();
    if (node["visual_markers"])
      opts.visualMarkers = node["visual_markers"].as<bool>();
    if (node["tolerance"])
      opts.tolerance = node["tolerance"].as<int>();
    if (node["threshold_ratio"])
      opts.thresholdRatio = node["threshold_ratio"].as<double>();
    if (node["target_fps"])
      opts.targetFps = node["target_fps"].as<int>();
    if (node["default_duration_seconds"])
      opts.defaultDurationSeconds = node["default_duration_seconds"].as<int>();
    if (node["persist_fingerprints"])
      opts.persistFingerprints = node["persist_fingerprints"].as<bool>();
    if (node["var_dir"])
      setVarDir(node["var_dir"].as<std::string>());
  } catch (const YAML::BadConversion &e) {
    throw std::invalid_argument(std::string("Invalid config value: ") +
                                e.what());
  }
}

RuntimeOptions loadRuntimeOptions(const std::string &path) {
  RuntimeOptions opts;
  std::string cfg = path;
  if (cfg.empty()) {
    const char *env = std::getenv("VIDSEAL_CONFIG");
    cfg = env ? env : "vidseal_config.yaml";
  }

  if (std::filesystem::exists(cfg)) {
    YAML::Node node;
    try {
      node = YAML::LoadFile(cfg);
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("Failed to parse config " + cfg + ": " +
                               e.what());
    }
    if (!node.IsNull() && !node.IsMap())
      throw std::runtime_error("Config " + cfg + " is not a YAML mapping");
    if (node.IsMap())
      applyYaml(opts, node);
  } else {
    Logger::getInstance().log(LogLevel::INFO,
                              "No config file at " + cfg + ", using defaults");
  }

  if (const char *env = std::getenv("VIDSEAL_GRID_SIZE"))
    opts.gridSize = envInt("VIDSEAL_GRID_SIZE", env);
  if (const char *env = std::getenv("VIDSEAL_FINGERPRINT_MODE"))
    opts.fingerprintMode = parseFingerprintMode(env);
  if (const char *env = std::getenv("VIDSEAL_AGGREGATION_MODE"))
    opts.aggregationMode = parseAggregationMode(env);
  if (const char *env = std::getenv("VIDSEAL_TAMPER_EVERY_N"))
    opts.tamperEveryN = envInt("VIDSEAL_TAMPER_EVERY_N", env);
  if (const char *env = std::getenv("VIDSEAL_TOLERANCE"))
    opts.tolerance = envInt("VIDSEAL_TOLERANCE", env);
  if (const char *env = std::getenv("VIDSEAL_THRESHOLD_RATIO"))
    opts.thresholdRatio = envDouble("VIDSEAL_THRESHOLD_RATIO", env);
  if (const char *env = std::getenv("VIDSEAL_TARGET_FPS"))
    opts.targetFps = envInt("VIDSEAL_TARGET_FPS", env);

  validateRuntimeOptions(opts);
  return opts;
}

} // namespace vidseal
