#include "codec/handle.hpp"

#include <stdexcept>

namespace vc::codec {

auto parse_handle_options(const Json &json) -> Expected<HandleOptions> {
  if (!json.is_object()) {
    return tl::unexpected(make_error(ErrorCode::InvalidConfig, "handle options must be an object"));
  }
  HandleOptions options;
  if (auto it = json.find("write_ext"); it != json.end()) {
    if (!it->is_boolean()) {
      return tl::unexpected(make_error(ErrorCode::InvalidConfig, "write_ext must be a boolean"));
    }
    options.write_ext = it->get<bool>();
  }
  return options;
}

Handle::Handle(EncoderFactory factory, HandleOptions options)
    : factory_(std::move(factory)), options_(options) {
  if (!factory_) {
    throw std::invalid_argument("handle requires an encoder factory");
  }
}

auto Handle::new_encoder(ByteSink &sink) const -> std::unique_ptr<PrimitiveEncoder> {
  return factory_(sink);
}

}  // namespace vc::codec
