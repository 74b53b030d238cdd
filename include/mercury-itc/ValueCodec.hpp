#pragma once
#include "mercury-itc/export.h"
#include <optional>
#include <string>

namespace mercuryitc {

/// Conversion between instrument numerals and plain doubles.
///
/// The instrument reports values as `<mantissa><prefix><unit>` where the
/// prefix is one of M, k, m, µ, n, p, or absent (a digit sits in front of the
/// unit letter). Micro is accepted both as the Latin-1 byte 0xB5 and as the
/// UTF-8 sequence 0xC2 0xB5.
class MERCURY_ITC_API ValueCodec {
public:
  static constexpr unsigned char MICRO_SIGN = 0xB5;

  /// Decode a payload token such as "7.000000mV" into base units.
  /// Throws DecodeError with the raw token on failure.
  static double decode(const std::string &token);

  /// Multiplier for an SI prefix character, nullopt when not recognized
  static std::optional<double> prefix_factor(char prefix);

  /// Bare fixed-point literal for configuration commands ("7", "2.5").
  /// No prefix character or unit letter is emitted.
  static std::string encode_magnitude(double value, const std::string &unit);
};

} // namespace mercuryitc
