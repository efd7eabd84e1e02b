#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pulse::util {

/*
  Domain errors raised by the graph model, the status board and the
  automation service. The transport maps each kind to a status code.
*/

enum class ErrorKind : std::uint8_t {
  kNotFound,       // automation, node, execution or handle id unknown
  kAlreadyExists,  // duplicate id or handle
  kInvalidState,   // illegal transition, stale run, nothing to stop
  kInvalidArgument,
  kInvalidGraph,   // structural problem; the graph was left unchanged
};

inline std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kAlreadyExists:
      return "already_exists";
    case ErrorKind::kInvalidState:
      return "invalid_state";
    case ErrorKind::kInvalidArgument:
      return "invalid_argument";
    case ErrorKind::kInvalidGraph:
      return "invalid_graph";
  }
  return "unknown";
}

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind kind() const {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

class NotFound : public Error {
 public:
  explicit NotFound(const std::string& msg) : Error(ErrorKind::kNotFound, msg) {
  }
};

class AlreadyExists : public Error {
 public:
  explicit AlreadyExists(const std::string& msg) : Error(ErrorKind::kAlreadyExists, msg) {
  }
};

class InvalidState : public Error {
 public:
  explicit InvalidState(const std::string& msg) : Error(ErrorKind::kInvalidState, msg) {
  }
};

class InvalidArgument : public Error {
 public:
  explicit InvalidArgument(const std::string& msg) : Error(ErrorKind::kInvalidArgument, msg) {
  }
};

// Structural graph errors. Raised before any mutation is made.
class InvalidGraph : public Error {
 public:
  explicit InvalidGraph(const std::string& msg) : Error(ErrorKind::kInvalidGraph, msg) {
  }
};

} // namespace pulse::util
