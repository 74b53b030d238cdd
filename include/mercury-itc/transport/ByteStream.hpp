#pragma once
#include "mercury-itc/export.h"
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace mercuryitc {
namespace transport {

/// Byte-oriented connection to the instrument (serial line or TCP socket).
///
/// open/write/read_some throw TransportError on failure. close() never
/// throws and may be called on a stream that is already closed.
class MERCURY_ITC_API ByteStream {
public:
  virtual ~ByteStream() = default;

  virtual void open() = 0;

  /// Write every byte of data
  virtual void write(const std::string &data) = 0;

  /// Read up to and excluding the next '\n'. Returns nullopt when no
  /// complete line arrived within the timeout.
  virtual std::optional<std::string>
  read_line(std::chrono::milliseconds timeout) = 0;

  /// One receive of at most max_bytes. Empty when the peer shut down or
  /// nothing arrived before the stream's read timeout.
  virtual std::string read_some(size_t max_bytes) = 0;

  /// Drain pending output and discard unread input
  virtual void flush() = 0;

  virtual void close() = 0;

  virtual bool is_open() const = 0;

  /// Human readable endpoint, for logs
  virtual std::string describe() const = 0;
};

using ByteStreamPtr = std::unique_ptr<ByteStream>;

/// Remove trailing whitespace, including any '\r' / '\n' terminator
MERCURY_ITC_API std::string rstrip(const std::string &text);

} // namespace transport
} // namespace mercuryitc
