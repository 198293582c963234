#pragma once

#include <cstdint>
#include <exception>
#include <format>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "codec/byte_sink.hpp"
#include "codec/error.hpp"
#include "codec/handle.hpp"
#include "codec/primitive_encoder.hpp"
#include "codec/value_encoder.hpp"

namespace vc::codec {

/// Encodes values to one output target with the configuration of a Handle.
///
/// Constructing an Encoder freezes the handle. An Encoder may be reused for
/// many sequential encode calls but must not be shared between threads.
class Encoder {
public:
  Encoder(std::unique_ptr<ByteSink> sink, Handle &handle);
  Encoder(Encoder &&) noexcept = default;
  auto operator=(Encoder &&) noexcept -> Encoder & = default;

  /// Encode one value and flush the sink.
  template <typename T> auto encode(const T &value) -> Status {
    try {
      if (auto status = engine_->encode(value); !status) {
        spdlog::debug("encode failed: code={} message={}", error_code_name(status.error().code),
                      status.error().message);
        return status;
      }
      return sink_->flush();
    } catch (const std::exception &e) {
      return aborted(std::format("encode aborted: {}", e.what()));
    } catch (...) {
      return aborted("encode aborted: unknown exception");
    }
  }

  auto sink() -> ByteSink & { return *sink_; }
  auto handle() const -> const Handle & { return *handle_; }

private:
  static auto aborted(std::string message) -> Status {
    spdlog::debug("encode failed: code={} message={}", error_code_name(ErrorCode::Internal),
                  message);
    return tl::unexpected(make_error(ErrorCode::Internal, std::move(message)));
  }

  std::unique_ptr<ByteSink> sink_;
  std::unique_ptr<PrimitiveEncoder> primitives_;
  std::unique_ptr<ValueEncoder> engine_;
  const Handle *handle_;
};

/// Encoder writing to a stream. Plain Writers are buffered internally.
auto make_encoder(Writer &writer, Handle &handle) -> Encoder;

/// Encoder writing into out. Each successful encode leaves out holding all
/// bytes written so far by this encoder.
auto make_bytes_encoder(std::vector<std::uint8_t> &out, Handle &handle) -> Encoder;

/// Encode value into a fresh byte vector.
template <typename T>
auto marshal(const T &value, Handle &handle) -> Expected<std::vector<std::uint8_t>> {
  std::vector<std::uint8_t> out;
  auto encoder = make_bytes_encoder(out, handle);
  if (auto status = encoder.encode(value); !status) {
    return tl::unexpected(status.error());
  }
  return out;
}

}  // namespace vc::codec
