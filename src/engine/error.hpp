#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace sid::engine {

enum class ErrorCode {
  UnsupportedSchemaNode,
  CycleDepthExceeded,
  ProviderFailure,
  InvalidIdentifier,
  InvalidOptions,
};

struct SchemaError {
  ErrorCode code = ErrorCode::ProviderFailure;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, SchemaError>;

inline auto make_error(ErrorCode code, std::string message) -> SchemaError {
  return SchemaError{code, std::move(message)};
}

inline auto to_string(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::UnsupportedSchemaNode:
      return "UnsupportedSchemaNodeError";
    case ErrorCode::CycleDepthExceeded:
      return "CycleDepthExceededError";
    case ErrorCode::ProviderFailure:
      return "ProviderFailure";
    case ErrorCode::InvalidIdentifier:
      return "InvalidIdentifierError";
    case ErrorCode::InvalidOptions:
      return "InvalidOptions";
  }
  return "unknown";
}

}  // namespace sid::engine
