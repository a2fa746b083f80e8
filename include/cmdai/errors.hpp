#pragma once

#include <stdexcept>
#include <string>

namespace cmdai {

class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Thrown only when the config path is unusable; parse problems fall back to defaults instead.
class ConfigLoadFailure : public Error {
 public:
  using Error::Error;
};

class PersistenceError : public Error {
 public:
  using Error::Error;
};

class UnknownOption : public Error {
 public:
  explicit UnknownOption(const std::string& option)
      : Error("unknown option: " + option), m_option(option) {}

  const std::string& option() const { return m_option; }

 private:
  std::string m_option;
};

class InvalidOptionValue : public Error {
 public:
  using Error::Error;
};

class BackendUnreachable : public Error {
 public:
  explicit BackendUnreachable(const std::string& reason, long httpStatus = 0)
      : Error(reason), m_httpStatus(httpStatus) {}

  // 0 when the failure happened below HTTP (refused, DNS, malformed body).
  long http_status() const { return m_httpStatus; }

 private:
  long m_httpStatus;
};

class BackendTimeout : public Error {
 public:
  using Error::Error;
};

class ExecutionError : public Error {
 public:
  using Error::Error;
};

}  // namespace cmdai
