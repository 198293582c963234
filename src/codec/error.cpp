#include "codec/error.hpp"

namespace vc::codec {

auto error_code_name(ErrorCode code) -> std::string_view {
  switch (code) {
  case ErrorCode::UnsupportedShape:
    return "unsupported_shape";
  case ErrorCode::Extension:
    return "extension";
  case ErrorCode::ShortWrite:
    return "short_write";
  case ErrorCode::Io:
    return "io";
  case ErrorCode::Frozen:
    return "frozen";
  case ErrorCode::InvalidConfig:
    return "invalid_config";
  case ErrorCode::Internal:
    return "internal";
  }
  return "unknown";
}

}  // namespace vc::codec
