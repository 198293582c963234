#include "codec/value_encoder.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "codec/encoder.hpp"
#include "test_support.hpp"

using vc::codec::Bytes;
using vc::codec::ErrorCode;
using vc::codec::ExtResult;
using vc::codec::Handle;
using vc::codec::HandleOptions;
using vc::codec::Json;
using vc::codec::Status;
using vc::codec::Value;
using namespace vc::codec::test_support;

namespace {

using Ops = std::vector<std::string>;

enum class Mode : std::uint16_t { Off = 0, On = 300 };

struct Money {
  std::int64_t cents = 0;
};

struct Unregistered {
  int value = 0;
};

struct Wallet {
  std::string owner;
  Money balance;
  std::unique_ptr<Money> limit;
};

auto money_ext(const Money &money) -> ExtResult {
  if (money.cents < 0) {
    return tl::unexpected(vc::codec::make_error(ErrorCode::Extension, "negative amount"));
  }
  if (money.cents == 0) {
    return std::optional<Bytes>();
  }
  return std::optional<Bytes>(Bytes{static_cast<std::uint8_t>(money.cents >> 8),
                                    static_cast<std::uint8_t>(money.cents)});
}

auto register_wallet() -> bool {
  static const bool registered = vc::codec::register_struct<Wallet>()
                                     .field("owner", &Wallet::owner)
                                     .field("balance", &Wallet::balance)
                                     .field("limit", &Wallet::limit, {.omit_empty = true})
                                     .install()
                                     .has_value();
  return registered;
}

class ValueEncoderTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(register_samples());
    ASSERT_TRUE(register_wallet());
  }

  template <typename T> auto encode(const T &value) -> Status {
    return encode_with(handle_, value);
  }

  template <typename T> auto encode_with(Handle &handle, const T &value) -> Status {
    ops.clear();
    out.clear();
    auto encoder = vc::codec::make_bytes_encoder(out, handle);
    return encoder.encode(value);
  }

  /// Records the generic path and the static fast path for the same value.
  template <typename T> auto both_paths(const T &value) -> std::pair<Ops, Ops> {
    EXPECT_TRUE(encode(value));
    auto fast = ops;
    EXPECT_TRUE(encode(Value::of(value)));
    return {fast, ops};
  }

  Ops ops;
  std::vector<std::uint8_t> out;
  Handle handle_{recording_factory(ops)};
};

}  // namespace

TEST_F(ValueEncoderTest, Scalars) {
  ASSERT_TRUE(encode(true));
  ASSERT_EQ(ops, (Ops{"bool:true"}));
  ASSERT_TRUE(encode(std::int8_t{-3}));
  ASSERT_EQ(ops, (Ops{"int:-3"}));
  ASSERT_TRUE(encode(std::uint16_t{7}));
  ASSERT_EQ(ops, (Ops{"uint:7"}));
  ASSERT_TRUE(encode(1.5F));
  ASSERT_EQ(ops, (Ops{"f32:1.5"}));
  ASSERT_TRUE(encode(2.25));
  ASSERT_EQ(ops, (Ops{"f64:2.25"}));
  ASSERT_TRUE(encode(std::string("hi")));
  ASSERT_EQ(ops, (Ops{"str:hi"}));
  ASSERT_TRUE(encode("lit"));
  ASSERT_EQ(ops, (Ops{"str:lit"}));
  const char *text = "ptr";
  ASSERT_TRUE(encode(text));
  ASSERT_EQ(ops, (Ops{"str:ptr"}));
}

TEST_F(ValueEncoderTest, FastPathMatchesGenericPath) {
  {
    auto [fast, generic] = both_paths(false);
    ASSERT_EQ(fast, generic);
  }
  {
    auto [fast, generic] = both_paths(std::int64_t{-900});
    ASSERT_EQ(fast, generic);
  }
  {
    auto [fast, generic] = both_paths(std::uint32_t{70000});
    ASSERT_EQ(fast, generic);
  }
  {
    auto [fast, generic] = both_paths(0.125F);
    ASSERT_EQ(fast, generic);
  }
  {
    auto [fast, generic] = both_paths(std::string_view("view"));
    ASSERT_EQ(fast, generic);
  }
  {
    std::int32_t number = 12;
    auto [fast, generic] = both_paths(&number);
    ASSERT_EQ(fast, generic);
    ASSERT_EQ(fast, (Ops{"int:12"}));
  }
}

TEST_F(ValueEncoderTest, NullsEncodeAsNil) {
  ASSERT_TRUE(encode(nullptr));
  ASSERT_EQ(ops, (Ops{"nil"}));
  std::int32_t *missing = nullptr;
  ASSERT_TRUE(encode(missing));
  ASSERT_EQ(ops, (Ops{"nil"}));
  ASSERT_TRUE(encode(Value{}));
  ASSERT_EQ(ops, (Ops{"nil"}));
  std::optional<std::vector<int>> absent;
  ASSERT_TRUE(encode(absent));
  ASSERT_EQ(ops, (Ops{"nil"}));
  std::shared_ptr<Point> shared;
  ASSERT_TRUE(encode(shared));
  ASSERT_EQ(ops, (Ops{"nil"}));
}

TEST_F(ValueEncoderTest, NilAndEmptyContainersDiffer) {
  std::optional<std::vector<int>> nil_slice;
  ASSERT_TRUE(encode(nil_slice));
  ASSERT_EQ(ops, (Ops{"nil"}));

  std::vector<int> empty_slice;
  ASSERT_TRUE(encode(empty_slice));
  ASSERT_EQ(ops, (Ops{"array:0"}));

  std::span<const int> view_of_empty(empty_slice);
  ASSERT_TRUE(encode(view_of_empty));
  ASSERT_EQ(ops, (Ops{"array:0"}));

  std::span<const int> unset_view;
  ASSERT_TRUE(encode(unset_view));
  ASSERT_EQ(ops, (Ops{"array:0"}));

  std::map<std::string, int> empty_map;
  ASSERT_TRUE(encode(empty_map));
  ASSERT_EQ(ops, (Ops{"map:0"}));
}

TEST_F(ValueEncoderTest, SequencesInIndexOrder) {
  std::vector<std::int32_t> numbers = {1, -2, 3};
  ASSERT_TRUE(encode(numbers));
  ASSERT_EQ(ops, (Ops{"array:3", "int:1", "int:-2", "int:3"}));

  std::array<std::string, 2> words = {"a", "b"};
  ASSERT_TRUE(encode(words));
  ASSERT_EQ(ops, (Ops{"array:2", "str:a", "str:b"}));

  std::uint16_t raw[2] = {5, 6};
  ASSERT_TRUE(encode(raw));
  ASSERT_EQ(ops, (Ops{"array:2", "uint:5", "uint:6"}));
}

TEST_F(ValueEncoderTest, ByteSlicesAreRawStrings) {
  std::vector<std::uint8_t> bytes = {1, 2, 3};
  ASSERT_TRUE(encode(bytes));
  ASSERT_EQ(ops, (Ops{"rawbytes:3"}));

  std::span<const std::uint8_t> view(bytes);
  ASSERT_TRUE(encode(view));
  ASSERT_EQ(ops, (Ops{"rawbytes:3"}));

  std::vector<std::int8_t> signed_bytes = {1, 2};
  ASSERT_TRUE(encode(signed_bytes));
  ASSERT_EQ(ops, (Ops{"array:2", "int:1", "int:2"}));

  std::array<std::uint8_t, 2> fixed = {1, 2};
  ASSERT_TRUE(encode(fixed));
  ASSERT_EQ(ops, (Ops{"rawbytes:2"}));

  std::uint8_t builtin[4] = {1, 2, 3, 4};
  ASSERT_TRUE(encode(builtin));
  ASSERT_EQ(ops, (Ops{"rawbytes:4"}));

  std::array<std::int8_t, 2> signed_fixed = {1, 2};
  ASSERT_TRUE(encode(signed_fixed));
  ASSERT_EQ(ops, (Ops{"array:2", "int:1", "int:2"}));
}

TEST_F(ValueEncoderTest, StringMapKeysAreSymbols) {
  std::map<std::string, std::int32_t> counts = {{"a", 1}, {"b", 2}};
  ASSERT_TRUE(encode(counts));
  ASSERT_EQ(ops, (Ops{"map:2", "sym:a", "int:1", "sym:b", "int:2"}));

  std::map<std::int32_t, std::string> names = {{1, "x"}};
  ASSERT_TRUE(encode(names));
  ASSERT_EQ(ops, (Ops{"map:1", "int:1", "str:x"}));
}

TEST_F(ValueEncoderTest, UnorderedMapEntriesStayPaired) {
  std::unordered_map<std::string, std::int32_t> counts = {{"a", 1}, {"b", 2}, {"c", 3}};
  ASSERT_TRUE(encode(counts));
  ASSERT_EQ(ops.size(), 7U);
  ASSERT_EQ(ops[0], "map:3");
  std::map<std::string, std::string> pairs;
  for (std::size_t i = 1; i < ops.size(); i += 2) {
    pairs[ops[i]] = ops[i + 1];
  }
  ASSERT_EQ(pairs, (std::map<std::string, std::string>{
                       {"sym:a", "int:1"}, {"sym:b", "int:2"}, {"sym:c", "int:3"}}));
}

TEST_F(ValueEncoderTest, StructsAreFieldMaps) {
  Point point{3, -4};
  ASSERT_TRUE(encode(point));
  ASSERT_EQ(ops, (Ops{"map:2", "sym:x", "int:3", "sym:y", "int:-4"}));
}

TEST_F(ValueEncoderTest, OmitEmptySkipsEmptyFields) {
  Labeled bare{"l", std::nullopt, {}};
  ASSERT_TRUE(encode(bare));
  ASSERT_EQ(ops, (Ops{"map:1", "sym:label", "str:l"}));

  Labeled full{"", 0, {"t"}};
  ASSERT_TRUE(encode(full));
  ASSERT_EQ(ops, (Ops{"map:3", "sym:label", "str:", "sym:weight", "int:0", "sym:tags", "array:1",
                      "str:t"}));
}

TEST_F(ValueEncoderTest, EmbeddedFieldsAreInlined) {
  Document document{"report", {"ana", 4}, 9};
  ASSERT_TRUE(encode(document));
  ASSERT_EQ(ops, (Ops{"map:3", "sym:title", "str:report", "sym:created_by", "str:ana",
                      "sym:revision", "uint:9"}));
}

TEST_F(ValueEncoderTest, EnumsUseUnderlyingInteger) {
  ASSERT_TRUE(encode(Mode::On));
  ASSERT_EQ(ops, (Ops{"uint:300"}));
}

TEST_F(ValueEncoderTest, VariantsEncodeHeldValue) {
  std::variant<std::monostate, std::int32_t, std::string> variant;
  ASSERT_TRUE(encode(variant));
  ASSERT_EQ(ops, (Ops{"nil"}));
  variant = 4;
  ASSERT_TRUE(encode(variant));
  ASSERT_EQ(ops, (Ops{"int:4"}));
  variant = std::string("s");
  ASSERT_TRUE(encode(variant));
  ASSERT_EQ(ops, (Ops{"str:s"}));
}

TEST_F(ValueEncoderTest, JsonDocuments) {
  auto document = Json::parse(R"({"a": [1, "x", null, true, 1.5], "b": {}})");
  ASSERT_TRUE(encode(document));
  ASSERT_EQ(ops, (Ops{"map:2", "sym:a", "array:5", "uint:1", "str:x", "nil", "bool:true",
                      "f64:1.5", "sym:b", "map:0"}));
}

TEST_F(ValueEncoderTest, UnregisteredStructFails) {
  Unregistered value;
  auto status = encode(value);
  ASSERT_FALSE(status);
  ASSERT_EQ(status.error().code, ErrorCode::UnsupportedShape);
  ASSERT_NE(status.error().message.find("Unregistered"), std::string::npos);
}

TEST_F(ValueEncoderTest, UnsupportedKindFails) {
  std::vector<bool> flags = {true};
  auto status = encode(flags);
  ASSERT_FALSE(status);
  ASSERT_EQ(status.error().code, ErrorCode::UnsupportedShape);
  ASSERT_TRUE(status.error().message.starts_with("unsupported kind: unsupported, for type: "));
}

TEST_F(ValueEncoderTest, ErrorStopsTraversal) {
  std::vector<std::vector<bool>> nested = {{true}};
  auto status = encode(nested);
  ASSERT_FALSE(status);
  ASSERT_EQ(ops, (Ops{"array:1"}));
}

TEST(ValueEncoderExtension, WritesTaggedPayload) {
  ASSERT_TRUE(register_wallet());
  Ops ops;
  Handle handle(recording_factory(ops));
  ASSERT_TRUE(handle.add_ext<Money>(5, money_ext));

  std::vector<std::uint8_t> out;
  auto encoder = vc::codec::make_bytes_encoder(out, handle);
  ASSERT_TRUE(encoder.encode(Money{0x0102}));
  ASSERT_EQ(ops, (Ops{"ext:5:2"}));
  ASSERT_EQ(out, bytes_of({1, 2}));
}

TEST(ValueEncoderExtension, RawBytesWhenExtDisabled) {
  Ops ops;
  Handle handle(recording_factory(ops), HandleOptions{.write_ext = false});
  ASSERT_TRUE(handle.add_ext<Money>(5, money_ext));

  std::vector<std::uint8_t> out;
  auto encoder = vc::codec::make_bytes_encoder(out, handle);
  ASSERT_TRUE(encoder.encode(Money{0x0102}));
  ASSERT_EQ(ops, (Ops{"rawbytes:2"}));
  ASSERT_TRUE(out.empty());
}

TEST(ValueEncoderExtension, MissingPayloadIsNil) {
  Ops ops;
  Handle handle(recording_factory(ops));
  ASSERT_TRUE(handle.add_ext<Money>(5, money_ext));

  std::vector<std::uint8_t> out;
  auto encoder = vc::codec::make_bytes_encoder(out, handle);
  ASSERT_TRUE(encoder.encode(Money{0}));
  ASSERT_EQ(ops, (Ops{"nil"}));
}

TEST(ValueEncoderExtension, ErrorsPropagate) {
  Ops ops;
  Handle handle(recording_factory(ops));
  ASSERT_TRUE(handle.add_ext<Money>(5, money_ext));

  std::vector<std::uint8_t> out;
  auto encoder = vc::codec::make_bytes_encoder(out, handle);
  std::vector<Money> amounts = {Money{1}, Money{-1}, Money{2}};
  auto status = encoder.encode(amounts);
  ASSERT_FALSE(status);
  ASSERT_EQ(status.error().code, ErrorCode::Extension);
  ASSERT_EQ(status.error().message, "negative amount");
  ASSERT_EQ(ops, (Ops{"array:3", "ext:5:2"}));
}

TEST(ValueEncoderExtension, OverridesStructFields) {
  ASSERT_TRUE(register_wallet());
  Ops ops;
  Handle handle(recording_factory(ops));
  ASSERT_TRUE(handle.add_ext<Money>(9, money_ext));

  std::vector<std::uint8_t> out;
  auto encoder = vc::codec::make_bytes_encoder(out, handle);
  Wallet wallet{"kim", Money{3}, std::make_unique<Money>(Money{4})};
  ASSERT_TRUE(encoder.encode(wallet));
  ASSERT_EQ(ops, (Ops{"map:3", "sym:owner", "str:kim", "sym:balance", "ext:9:2", "sym:limit",
                      "ext:9:2"}));
  ASSERT_EQ(out, bytes_of({0, 3, 0, 4}));
}

TEST(ValueEncoderBuiltin, HookRunsBeforeExtensions) {
  Ops ops;
  auto hook = [](const Value &value, Ops &log) -> vc::codec::Expected<bool> {
    if (const auto *money = value.as<Money>()) {
      log.push_back("builtin:" + std::to_string(money->cents));
      return true;
    }
    return false;
  };
  Handle handle(recording_factory(ops, hook));
  ASSERT_TRUE(handle.add_ext<Money>(5, money_ext));

  std::vector<std::uint8_t> out;
  auto encoder = vc::codec::make_bytes_encoder(out, handle);
  std::vector<Money> amounts = {Money{7}};
  ASSERT_TRUE(encoder.encode(amounts));
  ASSERT_EQ(ops, (Ops{"array:1", "builtin:7"}));
}

TEST(ValueEncoderBuiltin, HookErrorsPropagate) {
  Ops ops;
  auto hook = [](const Value &value, Ops &) -> vc::codec::Expected<bool> {
    if (value.kind() == vc::codec::Kind::String) {
      return tl::unexpected(vc::codec::make_error(ErrorCode::Internal, "hook failed"));
    }
    return false;
  };
  Handle handle(recording_factory(ops, hook));

  std::vector<std::uint8_t> out;
  auto encoder = vc::codec::make_bytes_encoder(out, handle);
  std::vector<std::string> words = {"a"};
  auto status = encoder.encode(words);
  ASSERT_FALSE(status);
  ASSERT_EQ(status.error().message, "hook failed");
}
