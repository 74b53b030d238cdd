#include "mercury-itc/ValueCodec.hpp"
#include "mercury-itc/Errors.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>

namespace mercuryitc {

namespace {

constexpr unsigned char UTF8_MICRO_LEAD = 0xC2;

std::string trim(const std::string &s) {
  size_t begin = 0;
  while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin])))
    ++begin;
  size_t end = s.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(begin, end - begin);
}

double parse_mantissa(const std::string &token, const std::string &mantissa) {
  std::string numeral = trim(mantissa);
  if (numeral.empty()) {
    throw DecodeError(token, "empty mantissa");
  }

  errno = 0;
  char *endptr = nullptr;
  double value = std::strtod(numeral.c_str(), &endptr);
  if (endptr != numeral.c_str() + numeral.size()) {
    throw DecodeError(token, "malformed numeral '" + numeral + "'");
  }
  if (errno == ERANGE && std::isinf(value)) {
    throw DecodeError(token, "numeral out of range");
  }
  return value;
}

} // namespace

std::optional<double> ValueCodec::prefix_factor(char prefix) {
  switch (static_cast<unsigned char>(prefix)) {
  case 'M':
    return 1e6;
  case 'k':
    return 1e3;
  case 'm':
    return 1e-3;
  case MICRO_SIGN:
    return 1e-6;
  case 'n':
    return 1e-9;
  case 'p':
    return 1e-12;
  default:
    return std::nullopt;
  }
}

double ValueCodec::decode(const std::string &token) {
  // At least one mantissa digit, the prefix slot and the unit letter
  if (token.size() < 3) {
    throw DecodeError(token, "token too short");
  }

  const char marker = token[token.size() - 2];
  std::string mantissa = token.substr(0, token.size() - 2);

  if (std::isdigit(static_cast<unsigned char>(marker))) {
    return parse_mantissa(token, mantissa);
  }

  if (static_cast<unsigned char>(marker) == MICRO_SIGN && !mantissa.empty() &&
      static_cast<unsigned char>(mantissa.back()) == UTF8_MICRO_LEAD) {
    mantissa.pop_back();
  }

  auto factor = prefix_factor(marker);
  if (!factor) {
    throw DecodeError(token, fmt::format("unrecognized SI prefix 0x{:02X}",
                                         static_cast<unsigned char>(marker)));
  }
  return parse_mantissa(token, mantissa) * *factor;
}

std::string ValueCodec::encode_magnitude(double value,
                                         const std::string &unit) {
  if (!std::isfinite(value)) {
    throw ItcError(fmt::format("Cannot encode non-finite magnitude {} {}",
                               value, unit));
  }

  std::string text = fmt::format("{:.6f}", value);
  auto last = text.find_last_not_of('0');
  if (text[last] == '.') {
    --last;
  }
  text.erase(last + 1);

  if (text == "-0") {
    text = "0";
  }
  return text;
}

} // namespace mercuryitc
