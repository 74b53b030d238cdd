#pragma once
#include "mercury-itc/export.h"
#include <stdexcept>
#include <string>

namespace mercuryitc {

/// Base of every error raised by the client library
class MERCURY_ITC_API ItcError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Stream open, write or read failure
class MERCURY_ITC_API TransportError : public ItcError {
public:
  using ItcError::ItcError;
};

/// Response token that cannot be turned into a number
class MERCURY_ITC_API DecodeError : public ItcError {
public:
  DecodeError(const std::string &token, const std::string &reason)
      : ItcError("Cannot decode '" + token + "': " + reason), token_(token) {}

  const std::string &token() const { return token_; }

private:
  std::string token_;
};

/// Device key missing from the registry
class MERCURY_ITC_API UnknownDeviceError : public ItcError {
public:
  explicit UnknownDeviceError(const std::string &key)
      : ItcError("Unknown device key: '" + key + "'"), key_(key) {}

  const std::string &key() const { return key_; }

private:
  std::string key_;
};

/// Every attempt of an exchange failed; no reading is available
class MERCURY_ITC_API FatalCommunicationError : public ItcError {
public:
  FatalCommunicationError(const std::string &command, int attempts,
                          const std::string &last_error)
      : ItcError("Communication failed " + std::to_string(attempts) +
                 " times for '" + command + "': " + last_error),
        command_(command), attempts_(attempts) {}

  const std::string &command() const { return command_; }
  int attempts() const { return attempts_; }

private:
  std::string command_;
  int attempts_;
};

/// Invalid or unreadable configuration document
class MERCURY_ITC_API ConfigError : public ItcError {
public:
  using ItcError::ItcError;
};

} // namespace mercuryitc
