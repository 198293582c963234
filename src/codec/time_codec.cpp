#include "codec/time_codec.hpp"

#include <array>
#include <cstddef>
#include <limits>
#include <optional>

namespace vc::codec {

namespace {

template <typename T> auto put_be(std::uint8_t *out, T value) -> void {
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    out[i] = static_cast<std::uint8_t>(value >> (8 * (sizeof(T) - 1 - i)));
  }
}

}  // namespace

auto encode_time(const Timestamp &timestamp) -> std::vector<std::uint8_t> {
  using namespace std::chrono;

  const auto secs = floor<seconds>(timestamp.time);
  const auto tsecs = static_cast<std::int64_t>(secs.time_since_epoch().count());
  const auto tnsecs = static_cast<std::uint32_t>((timestamp.time - secs).count());

  std::array<std::uint8_t, 14> bs{};
  std::size_t i = 0;
  bool pad_zero = false;

  if (tsecs > std::numeric_limits<std::int32_t>::min() &&
      tsecs < std::numeric_limits<std::int32_t>::max()) {
    put_be(bs.data() + i, static_cast<std::uint32_t>(static_cast<std::int32_t>(tsecs)));
    i += 4;
  } else {
    put_be(bs.data() + i, static_cast<std::uint64_t>(tsecs));
    i += 8;
    pad_zero = tnsecs == 0;
  }
  if (tnsecs != 0) {
    put_be(bs.data() + i, tnsecs);
    i += 4;
  }
  if (timestamp.zone_offset) {
    auto minutes = duration_cast<std::chrono::minutes>(*timestamp.zone_offset).count();
    const bool negative = minutes < 0;
    if (negative) {
      minutes = -minutes;
    }
    auto zone = static_cast<std::uint16_t>(minutes);
    if (negative) {
      zone |= static_cast<std::uint16_t>(1U << 15);
    }
    put_be(bs.data() + i, zone);
    i += 2;
  }
  if (pad_zero) {
    i += 1;
  }
  return {bs.begin(), bs.begin() + static_cast<std::ptrdiff_t>(i)};
}

auto register_time_ext(Handle &handle, std::uint8_t tag) -> Status {
  return handle.add_ext<Timestamp>(tag, [](const Timestamp &timestamp) -> ExtResult {
    return std::optional<Bytes>(encode_time(timestamp));
  });
}

}  // namespace vc::codec
