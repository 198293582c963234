#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace vc::codec {

enum class ErrorCode {
  UnsupportedShape,
  Extension,
  ShortWrite,
  Io,
  Frozen,
  InvalidConfig,
  Internal,
};

struct EncodeError {
  ErrorCode code = ErrorCode::Internal;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, EncodeError>;

using Status = Expected<void>;

inline auto make_error(ErrorCode code, std::string message) -> EncodeError {
  return EncodeError{code, std::move(message)};
}

auto error_code_name(ErrorCode code) -> std::string_view;

}  // namespace vc::codec
