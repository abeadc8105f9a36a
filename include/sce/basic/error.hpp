// sce/basic/error.hpp - Error taxonomy and result type for engine operations
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace sce
{

// ============================================================================
// Error Types
// ============================================================================

/**
 * Failure categories surfaced to callers.
 *
 * The string name of each code (see to_string) is part of the wire format.
 */
enum class ErrorCode : uint8_t {
  Unsupported,         ///< filename/language not mappable to a known grammar
  ParseFailure,        ///< grammar present but no tree could be produced
  SeedNotFound,        ///< cursor is not on or near any identifier
  ArityMismatch,       ///< argument count differs from parameter count
  TargetUnresolvable,  ///< no function definition at the target point
  CallNotFound,        ///< no call expression at the call-site point
  MissingReturnValue,  ///< call used as a value but the body returns nothing
  InvalidRequest,      ///< malformed request
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

/// Inverse of to_string
[[nodiscard]] std::optional<ErrorCode> parse_error_code(std::string_view name) noexcept;

struct Error
{
  ErrorCode code = ErrorCode::InvalidRequest;
  std::string message;

  /// "Code: message", used by log lines and CLI output.
  [[nodiscard]] std::string describe() const;
};

[[nodiscard]] inline Error make_error(ErrorCode code, std::string message)
{
  return Error{code, std::move(message)};
}

// ============================================================================
// Result Type
// ============================================================================

/**
 * Holds either a success value T or an Error.
 */
template <typename T>
class Result
{
public:
  using ValueType = T;
  using ErrorType = Error;

  // Construct with success value
  Result(T value) : data_(std::move(value)) {}

  // Construct with error
  Result(Error error) : data_(std::move(error)) {}

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] bool has_error() const { return std::holds_alternative<Error>(data_); }

  explicit operator bool() const { return has_value(); }

  // Get the value (undefined behavior if has_error())
  T & value() & { return std::get<T>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<T>(data_); }
  T && value() && { return std::get<T>(std::move(data_)); }

  // Get the error (undefined behavior if has_value())
  Error & error() & { return std::get<Error>(data_); }
  [[nodiscard]] const Error & error() const & { return std::get<Error>(data_); }
  Error && error() && { return std::get<Error>(std::move(data_)); }

  T * operator->() { return &value(); }
  const T * operator->() const { return &value(); }
  T & operator*() & { return value(); }
  const T & operator*() const & { return value(); }

private:
  std::variant<T, Error> data_;
};

}  // namespace sce
