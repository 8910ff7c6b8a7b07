#pragma once

#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace sitenav {

/// Base class of every recoverable failure raised by the search engine.
/// MUST be caught by callers that want to handle engine failures uniformly.
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Raised when a required node/element argument is absent.
/// MUST carry the parameter name so diagnostics point at the caller's mistake.
class NilParameterError : public Error {
 public:
  explicit NilParameterError(const std::string& parameter)
      : Error("Parameter (" + parameter + ") must not be nil"), parameter_(parameter) {}

  const std::string& parameter() const { return parameter_; }

 private:
  std::string parameter_;
};

/// Raised when a children producer fails during tree construction.
/// MUST keep the original failure reachable through cause().
/// Stage and ordinal are set only by the cascading search (1-based).
class BuildFailureError : public Error {
 public:
  BuildFailureError(const std::string& message, std::exception_ptr cause)
      : Error(message), cause_(std::move(cause)) {}
  BuildFailureError(const std::string& message,
                    std::exception_ptr cause,
                    size_t stage,
                    size_t ordinal)
      : Error(message), cause_(std::move(cause)), stage_(stage), ordinal_(ordinal) {}

  std::exception_ptr cause() const { return cause_; }
  std::optional<size_t> stage() const { return stage_; }
  std::optional<size_t> ordinal() const { return ordinal_; }

 private:
  std::exception_ptr cause_;
  std::optional<size_t> stage_;
  std::optional<size_t> ordinal_;
};

/// Raised when a BFS/DFS traversal cannot complete.
/// cause() holds the visitor's original failure when there was one.
class TraversalFailureError : public Error {
 public:
  explicit TraversalFailureError(const std::string& message, std::exception_ptr cause = nullptr)
      : Error(message), cause_(std::move(cause)) {}

  std::exception_ptr cause() const { return cause_; }

 private:
  std::exception_ptr cause_;
};

/// Raised when a textual criteria cannot be parsed.
/// MUST report a 0-based byte position into the criteria text.
class CriteriaParseError : public Error {
 public:
  CriteriaParseError(const std::string& message, size_t position)
      : Error(message + " at position " + std::to_string(position)), position_(position) {}

  size_t position() const { return position_; }

 private:
  size_t position_ = 0;
};

}  // namespace sitenav
