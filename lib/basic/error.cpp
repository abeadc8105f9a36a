// sce/basic/error.cpp - Error code names
#include "sce/basic/error.hpp"

namespace sce
{

std::string_view to_string(ErrorCode code) noexcept
{
  switch (code) {
    case ErrorCode::Unsupported:
      return "Unsupported";
    case ErrorCode::ParseFailure:
      return "ParseFailure";
    case ErrorCode::SeedNotFound:
      return "SeedNotFound";
    case ErrorCode::ArityMismatch:
      return "ArityMismatch";
    case ErrorCode::TargetUnresolvable:
      return "TargetUnresolvable";
    case ErrorCode::CallNotFound:
      return "CallNotFound";
    case ErrorCode::MissingReturnValue:
      return "MissingReturnValue";
    case ErrorCode::InvalidRequest:
      return "InvalidRequest";
  }
  return "Unknown";
}

std::optional<ErrorCode> parse_error_code(std::string_view name) noexcept
{
  for (const ErrorCode code :
       {ErrorCode::Unsupported, ErrorCode::ParseFailure, ErrorCode::SeedNotFound,
        ErrorCode::ArityMismatch, ErrorCode::TargetUnresolvable, ErrorCode::CallNotFound,
        ErrorCode::MissingReturnValue, ErrorCode::InvalidRequest}) {
    if (to_string(code) == name) return code;
  }
  return std::nullopt;
}

std::string Error::describe() const
{
  std::string out(to_string(code));
  out += ": ";
  out += message;
  return out;
}

}  // namespace sce
