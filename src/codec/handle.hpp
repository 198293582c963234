#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

#include "codec/byte_sink.hpp"
#include "codec/error.hpp"
#include "codec/ext_registry.hpp"
#include "codec/primitive_encoder.hpp"
#include "codec/value.hpp"

namespace vc::codec {

/// Creates the format encoder bound to one sink.
using EncoderFactory = std::function<std::unique_ptr<PrimitiveEncoder>(ByteSink &)>;

struct HandleOptions {
  /// Write extension payloads as tagged extension blobs; when false they are
  /// written as raw byte strings.
  bool write_ext = true;
};

/// Parse handle options from a JSON object, e.g. {"write_ext": false}.
auto parse_handle_options(const Json &json) -> Expected<HandleOptions>;

/// Shared encoding configuration: extension table, extension policy and the
/// wire format factory. Configure first; creating an Encoder freezes it and
/// later extension changes fail.
class Handle {
public:
  explicit Handle(EncoderFactory factory, HandleOptions options = {});
  Handle(const Handle &) = delete;
  auto operator=(const Handle &) -> Handle & = delete;

  auto add_ext(const entt::type_info &type, std::uint8_t tag, ExtFn fn) -> Status {
    return extensions_.add(type, tag, std::move(fn));
  }
  template <typename T, typename Fn> auto add_ext(std::uint8_t tag, Fn fn) -> Status {
    return extensions_.add<T>(tag, std::move(fn));
  }
  template <typename T> auto remove_ext() -> Status {
    return extensions_.remove(entt::type_id<T>());
  }

  auto extensions() const -> const ExtensionRegistry & { return extensions_; }
  auto options() const -> const HandleOptions & { return options_; }
  auto write_ext() const -> bool { return options_.write_ext; }

  auto freeze() -> void { extensions_.freeze(); }
  auto frozen() const -> bool { return extensions_.frozen(); }

  auto new_encoder(ByteSink &sink) const -> std::unique_ptr<PrimitiveEncoder>;

private:
  EncoderFactory factory_;
  HandleOptions options_;
  ExtensionRegistry extensions_;
};

}  // namespace vc::codec
