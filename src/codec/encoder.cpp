#include "codec/encoder.hpp"

#include <stdexcept>

namespace vc::codec {

Encoder::Encoder(std::unique_ptr<ByteSink> sink, Handle &handle)
    : sink_(std::move(sink)), handle_(&handle) {
  if (!sink_) {
    throw std::invalid_argument("encoder requires a byte sink");
  }
  handle.freeze();
  primitives_ = handle.new_encoder(*sink_);
  if (!primitives_) {
    throw std::invalid_argument("encoder factory returned no primitive encoder");
  }
  engine_ = std::make_unique<ValueEncoder>(*primitives_, *sink_, handle);
}

auto make_encoder(Writer &writer, Handle &handle) -> Encoder {
  return Encoder(std::make_unique<StreamSink>(writer), handle);
}

auto make_bytes_encoder(std::vector<std::uint8_t> &out, Handle &handle) -> Encoder {
  return Encoder(std::make_unique<BufferSink>(out), handle);
}

}  // namespace vc::codec
