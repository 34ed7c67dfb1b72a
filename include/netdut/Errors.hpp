#pragma once
#include "netdut/export.h"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace netdut {

/// Base of every error raised by netdut
class NETDUT_API Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Rule tables, patterns, dialect registrations or config files that cannot
/// be used. Raised at construction/registration time.
class NETDUT_API ConfigurationError : public Error {
public:
  using Error::Error;
};

/// A rule's pattern or replacement template failed to compile
class NETDUT_API RuleCompileError : public ConfigurationError {
public:
  RuleCompileError(const std::string &dialect, size_t index,
                   const std::string &pattern, const std::string &reason);

  const std::string &dialect() const { return dialect_; }
  size_t index() const { return index_; }
  const std::string &pattern() const { return pattern_; }

private:
  std::string dialect_;
  size_t index_;
  std::string pattern_;
};

/// Translation requested for a dialect that has no rule table
class NETDUT_API UnknownDialectError : public ConfigurationError {
public:
  explicit UnknownDialectError(const std::string &dialect);

  const std::string &dialect() const { return dialect_; }

private:
  std::string dialect_;
};

/// Two keys of one mapping normalize to the same key
class NETDUT_API KeyCollisionError : public ConfigurationError {
public:
  KeyCollisionError(const std::string &path, const std::string &first_key,
                    const std::string &second_key,
                    const std::string &normalized_key);

  const std::string &path() const { return path_; }
  const std::string &normalized_key() const { return normalized_key_; }

private:
  std::string path_;
  std::string normalized_key_;
};

/// A capability pattern is not a valid regular expression
class NETDUT_API InvalidPatternError : public ConfigurationError {
public:
  InvalidPatternError(const std::string &pattern, const std::string &reason);

  const std::string &pattern() const { return pattern_; }

private:
  std::string pattern_;
};

/// A command line is longer than the pattern matcher accepts
class NETDUT_API CommandTooLongError : public Error {
public:
  CommandTooLongError(const std::string &dialect, const std::string &line,
                      size_t limit);

  size_t length() const { return length_; }
  size_t limit() const { return limit_; }

private:
  size_t length_;
  size_t limit_;
};

/// The transport returned a reply that does not fit the request
class NETDUT_API TransportError : public Error {
public:
  using Error::Error;
};

/// The device CLI reported an error line ("% ...") for a command
class NETDUT_API CliCommandError : public Error {
public:
  CliCommandError(const std::string &message, const std::string &output)
      : Error(message), output_(output) {}

  /// Cleaned CLI output the error was found in
  const std::string &output() const { return output_; }

private:
  std::string output_;
};

} // namespace netdut
