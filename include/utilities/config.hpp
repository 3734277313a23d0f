#ifndef VIDSEAL_CONFIG_HPP
#define VIDSEAL_CONFIG_HPP

#include "fingerprint/fingerprint.h"
#include "ledger/combined_digest.h"

#include <string>

namespace vidseal {

/**
 * @brief Deployment-wide settings of the integrity engine.
 *
 * Fingerprint and aggregation modes are chosen once per deployment and are
 * never mixed inside a session.
 */
struct RuntimeOptions {
  int gridSize = DEFAULT_GRID_SIZE;
  FingerprintMode fingerprintMode = FingerprintMode::PlainSum;
  AggregationMode aggregationMode = AggregationMode::Fingerprints;
  int tamperEveryN = 5; ///< 0 disables tamper injection
  bool visualMarkers = true;
  int tolerance = 10;
  double thresholdRatio = 0.1;
  int targetFps = 20;
  int defaultDurationSeconds = 30;
  bool persistFingerprints = true;
};

/**
 * @brief Load options from a YAML file, then apply VIDSEAL_* environment
 * overrides.
 *
 * A missing file leaves the defaults in place. A present but unparsable file
 * raises std::runtime_error; out-of-range or unknown values raise
 * std::invalid_argument. A "var_dir" key is forwarded to setVarDir().
 *
 * @param path YAML file; empty means $VIDSEAL_CONFIG or vidseal_config.yaml.
 */
RuntimeOptions loadRuntimeOptions(const std::string &path = "");

/** Reject values no component can work with. @throw std::invalid_argument */
void validateRuntimeOptions(const RuntimeOptions &opts);

FingerprintMode parseFingerprintMode(const std::string &name);
AggregationMode parseAggregationMode(const std::string &name);
std::string toString(FingerprintMode mode);
std::string toString(AggregationMode mode);

} // namespace vidseal

#endif // VIDSEAL_CONFIG_HPP
