#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace vidseal {

static std::string varDir = [] {
  const char *env = std::getenv("VIDSEAL_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/vidseal"))
    return std::string("/var/vidseal");
  return std::string("var/vidseal");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string ledgersDir() { return getVarDir() + "/ledgers"; }

std::string inputLedgerPath() { return ledgersDir() + "/input_sha_log.json"; }

std::string outputLedgerPath() { return ledgersDir() + "/output_sha_log.json"; }

} // namespace vidseal
