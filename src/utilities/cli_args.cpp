#include "utilities/cli_args.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace vidseal {

std::map<std::string, std::string>
parseFlags(const std::vector<std::string> &args, std::size_t first,
           const std::set<std::string> &allowed) {
  std::map<std::string, std::string> flags;
  for (std::size_t i = first; i < args.size(); i += 2) {
    const std::string &name = args[i];
    if (allowed.count(name) == 0)
      throw std::invalid_argument("Unknown option " + name);
    if (i + 1 >= args.size())
      throw std::invalid_argument("Option " + name + " needs a value");
    flags[name] = args[i + 1];
  }
  return flags;
}

// std::stoul happily wraps "-1", so digits are checked first.
static unsigned long long parseDigits(const std::string &text,
                                      const std::string &what) {
  if (text.empty())
    throw std::invalid_argument(what + " is empty");
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      throw std::invalid_argument(what + " is not a non-negative integer: " +
                                  text);
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range &) {
    throw std::invalid_argument(what + " is out of range: " + text);
  }
}

std::uint32_t parsePositive(const std::string &text, const std::string &what) {
  unsigned long long v = parseDigits(text, what);
  if (v == 0 || v > std::numeric_limits<std::uint32_t>::max())
    throw std::invalid_argument(what + " must be between 1 and 4294967295: " +
                                text);
  return static_cast<std::uint32_t>(v);
}

int parseNonNegative(const std::string &text, const std::string &what) {
  unsigned long long v = parseDigits(text, what);
  if (v > static_cast<unsigned long long>(std::numeric_limits<int>::max()))
    throw std::invalid_argument(what + " is out of range: " + text);
  return static_cast<int>(v);
}

double parseRatio(const std::string &text, const std::string &what) {
  double v = 0.0;
  std::size_t used = 0;
  try {
    v = std::stod(text, &used);
  } catch (const std::exception &) {
    throw std::invalid_argument(what + " is not a number: " + text);
  }
  if (used != text.size() || !std::isfinite(v) || v < 0.0)
    throw std::invalid_argument(what + " must be a number >= 0: " + text);
  return v;
}

} // namespace vidseal
