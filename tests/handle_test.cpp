#include "codec/handle.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "codec/encoder.hpp"
#include "codec/msgpack.hpp"
#include "test_support.hpp"

using vc::codec::ErrorCode;
using vc::codec::Handle;
using vc::codec::Json;
using vc::codec::parse_handle_options;
using vc::codec::parse_msgpack_options;
using vc::codec::test_support::recording_factory;

TEST(HandleOptions, DefaultsWhenAbsent) {
  auto options = parse_handle_options(Json::object());
  ASSERT_TRUE(options);
  ASSERT_TRUE(options->write_ext);
}

TEST(HandleOptions, ParsesWriteExt) {
  auto options = parse_handle_options(Json::parse(R"({"write_ext": false})"));
  ASSERT_TRUE(options);
  ASSERT_FALSE(options->write_ext);
}

TEST(HandleOptions, RejectsWrongTypes) {
  auto not_object = parse_handle_options(Json::array());
  ASSERT_FALSE(not_object);
  ASSERT_EQ(not_object.error().code, ErrorCode::InvalidConfig);

  auto not_bool = parse_handle_options(Json::parse(R"({"write_ext": "yes"})"));
  ASSERT_FALSE(not_bool);
  ASSERT_EQ(not_bool.error().code, ErrorCode::InvalidConfig);
}

TEST(MsgpackOptions, ParsesRawAsString) {
  auto options = parse_msgpack_options(Json::parse(R"({"raw_as_string": true})"));
  ASSERT_TRUE(options);
  ASSERT_TRUE(options->raw_as_string);

  auto invalid = parse_msgpack_options(Json::parse(R"({"raw_as_string": 1})"));
  ASSERT_FALSE(invalid);
  ASSERT_EQ(invalid.error().code, ErrorCode::InvalidConfig);
}

TEST(Handle, RequiresFactory) {
  ASSERT_THROW(Handle(vc::codec::EncoderFactory{}), std::invalid_argument);
}

TEST(Handle, CreatingEncoderFreezesExtensions) {
  std::vector<std::string> ops;
  Handle handle(recording_factory(ops));
  ASSERT_TRUE(handle.add_ext<std::string>(1, [](const std::string &) -> vc::codec::ExtResult {
    return std::nullopt;
  }));
  ASSERT_FALSE(handle.frozen());

  std::vector<std::uint8_t> out;
  auto encoder = vc::codec::make_bytes_encoder(out, handle);
  ASSERT_TRUE(handle.frozen());

  auto status = handle.remove_ext<std::string>();
  ASSERT_FALSE(status);
  ASSERT_EQ(status.error().code, ErrorCode::Frozen);
  ASSERT_EQ(handle.extensions().size(), 1U);
}

TEST(Handle, MsgpackHandleCarriesOptions) {
  auto handle = vc::codec::make_msgpack_handle({}, {.write_ext = false});
  ASSERT_NE(handle, nullptr);
  ASSERT_FALSE(handle->write_ext());
  ASSERT_FALSE(handle->frozen());
}
