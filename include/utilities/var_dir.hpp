#pragma once

#include <string>

namespace vidseal {

void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();
std::string ledgersDir();

/// Persisted ledger of the unmodified ("input") stream.
std::string inputLedgerPath();
/// Persisted ledger of the delivered ("output") stream.
std::string outputLedgerPath();

} // namespace vidseal
