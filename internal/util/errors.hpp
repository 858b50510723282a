#pragma once

#include <stdexcept>
#include <string>

namespace blockforge::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Oracle call failed or returned output that does not follow the response grammar.
class OracleFailure : public std::runtime_error {
 public:
  explicit OracleFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class HealPrecondition : public std::runtime_error {
 public:
  explicit HealPrecondition(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExecutionFailure : public std::runtime_error {
 public:
  enum class Kind {
    kSpawn,
    kNonZeroExit,
    kTimeout,
    kInvalidOutput,
  };

  ExecutionFailure(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  Kind kind() const {
    return kind_;
  }

 private:
  Kind kind_;
};

const char* KindName(ExecutionFailure::Kind kind);

} // namespace blockforge::util
