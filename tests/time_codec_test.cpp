#include "codec/time_codec.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "codec/encoder.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using vc::codec::encode_time;
using vc::codec::Timestamp;
using vc::codec::test_support::bytes_of;

namespace {

auto at(std::chrono::nanoseconds since_epoch) -> Timestamp {
  return Timestamp{std::chrono::sys_time<std::chrono::nanoseconds>(since_epoch), std::nullopt};
}

}  // namespace

TEST(TimeCodec, ShortSecondsOnly) {
  ASSERT_EQ(encode_time(at(1s)), bytes_of({0, 0, 0, 1}));
}

TEST(TimeCodec, ShortWithNanoseconds) {
  ASSERT_EQ(encode_time(at(1s + 500ns)), bytes_of({0, 0, 0, 1, 0, 0, 0x01, 0xf4}));
}

TEST(TimeCodec, ShortWithZone) {
  auto timestamp = at(1s);
  timestamp.zone_offset = 1h;
  ASSERT_EQ(encode_time(timestamp), bytes_of({0, 0, 0, 1, 0x00, 0x3c}));
}

TEST(TimeCodec, ZeroOffsetZoneIsStillWritten) {
  auto timestamp = at(1s);
  timestamp.zone_offset = 0s;
  ASSERT_EQ(encode_time(timestamp).size(), 6U);
}

TEST(TimeCodec, NegativeOffsetSetsSignBit) {
  auto timestamp = at(0s);
  timestamp.zone_offset = -90min;
  ASSERT_EQ(encode_time(timestamp), bytes_of({0, 0, 0, 0, 0x80, 0x5a}));
}

TEST(TimeCodec, OffsetTruncatesTowardZero) {
  auto timestamp = at(0s);
  timestamp.zone_offset = -90s;
  ASSERT_EQ(encode_time(timestamp), bytes_of({0, 0, 0, 0, 0x80, 0x01}));
  timestamp.zone_offset = -30s;
  ASSERT_EQ(encode_time(timestamp), bytes_of({0, 0, 0, 0, 0x00, 0x00}));
}

TEST(TimeCodec, LongFormPadsWithoutNanoseconds) {
  auto seconds = std::chrono::seconds(std::int64_t{1} << 31);
  ASSERT_EQ(encode_time(at(seconds)), bytes_of({0, 0, 0, 0, 0x80, 0, 0, 0, 0}));
}

TEST(TimeCodec, Int32BoundsUseLongForm) {
  auto max = std::chrono::seconds(std::numeric_limits<std::int32_t>::max());
  auto min = std::chrono::seconds(std::numeric_limits<std::int32_t>::min());
  ASSERT_EQ(encode_time(at(max)).size(), 9U);
  ASSERT_EQ(encode_time(at(min)).size(), 9U);
  ASSERT_EQ(encode_time(at(max - 1s)).size(), 4U);
  ASSERT_EQ(encode_time(at(min + 1s)).size(), 4U);
}

TEST(TimeCodec, LongFormWithEverything) {
  auto timestamp = at(std::chrono::seconds(std::int64_t{1} << 40) + 1ns);
  timestamp.zone_offset = 2h;
  auto bytes = encode_time(timestamp);
  ASSERT_EQ(bytes.size(), 14U);
  ASSERT_EQ(bytes, bytes_of({0, 0, 0x01, 0, 0, 0, 0, 0, 0, 0, 0, 1, 0, 0x78}));
}

TEST(TimeCodec, NegativeInstantFloorsSeconds) {
  ASSERT_EQ(encode_time(at(-1500ms)),
            bytes_of({0xff, 0xff, 0xff, 0xfe, 0x1d, 0xcd, 0x65, 0x00}));
}

TEST(TimeCodec, RegisteredAsExtension) {
  std::vector<std::string> ops;
  vc::codec::Handle handle(vc::codec::test_support::recording_factory(ops));
  ASSERT_TRUE(vc::codec::register_time_ext(handle, 1));

  std::vector<std::uint8_t> out;
  auto encoder = vc::codec::make_bytes_encoder(out, handle);
  auto timestamp = at(1s + 500ns);
  ASSERT_TRUE(encoder.encode(timestamp));
  ASSERT_EQ(ops, (std::vector<std::string>{"ext:1:8"}));
  ASSERT_EQ(out, bytes_of({0, 0, 0, 1, 0, 0, 0x01, 0xf4}));
}
