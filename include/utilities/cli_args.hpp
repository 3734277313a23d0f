#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace vidseal {

/**
 * @brief Collect "--flag value" pairs from args[first..].
 * @throw std::invalid_argument for an unknown flag or a flag without a value.
 */
std::map<std::string, std::string>
parseFlags(const std::vector<std::string> &args, std::size_t first,
           const std::set<std::string> &allowed);

/// Decimal integer > 0 that fits in 32 bits. @throw std::invalid_argument
std::uint32_t parsePositive(const std::string &text, const std::string &what);

/// Decimal integer >= 0. @throw std::invalid_argument
int parseNonNegative(const std::string &text, const std::string &what);

/// Finite number >= 0. @throw std::invalid_argument
double parseRatio(const std::string &text, const std::string &what);

} // namespace vidseal
