#include <benchmark/benchmark.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "codec/encoder.hpp"
#include "codec/msgpack.hpp"
#include "codec/struct_info.hpp"
#include "codec/time_codec.hpp"

namespace {

struct Order {
  std::uint64_t id = 0;
  std::string customer;
  std::vector<double> prices;
  std::map<std::string, std::int64_t> counters;
  vc::codec::Timestamp placed;
};

auto register_order() -> void {
  static std::once_flag once;
  std::call_once(once, [] {
    auto status = vc::codec::register_struct<Order>()
                      .field("id", &Order::id)
                      .field("customer", &Order::customer)
                      .field("prices", &Order::prices)
                      .field("counters", &Order::counters, {.omit_empty = true})
                      .field("placed", &Order::placed)
                      .install();
    if (!status) {
      throw std::runtime_error(status.error().message);
    }
  });
}

auto make_order() -> Order {
  Order order;
  order.id = 4242;
  order.customer = "customer-00042";
  order.prices = {1.25, 9.5, 100.0, 0.01};
  order.counters = {{"views", 12}, {"clicks", 3}};
  order.placed.time = std::chrono::sys_time<std::chrono::nanoseconds>(
      std::chrono::seconds(1700000000) + std::chrono::nanoseconds(15));
  return order;
}

class EncodeBenchmark : public benchmark::Fixture {
public:
  void SetUp(const benchmark::State &) override {
    register_order();
    handle_ = vc::codec::make_msgpack_handle();
    if (!vc::codec::register_time_ext(*handle_, 1)) {
      throw std::runtime_error("time extension registration failed");
    }
  }

  void TearDown(const benchmark::State &) override { handle_.reset(); }

protected:
  std::unique_ptr<vc::codec::Handle> handle_;
};

}  // namespace

BENCHMARK_DEFINE_F(EncodeBenchmark, Scalar)(benchmark::State &state) {
  std::vector<std::uint8_t> out;
  out.reserve(64);
  auto encoder = vc::codec::make_bytes_encoder(out, *handle_);
  std::int64_t value = -123456;
  for (auto _ : state) {
    out.clear();
    if (auto status = encoder.encode(value); !status) {
      state.SkipWithError(status.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(out.data());
  }
}
BENCHMARK_REGISTER_F(EncodeBenchmark, Scalar);

BENCHMARK_DEFINE_F(EncodeBenchmark, Struct)(benchmark::State &state) {
  const auto order = make_order();
  std::vector<std::uint8_t> out;
  auto encoder = vc::codec::make_bytes_encoder(out, *handle_);
  for (auto _ : state) {
    out.clear();
    if (auto status = encoder.encode(order); !status) {
      state.SkipWithError(status.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(out.data());
  }
  state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) *
                          static_cast<std::int64_t>(out.size()));
}
BENCHMARK_REGISTER_F(EncodeBenchmark, Struct);

BENCHMARK_DEFINE_F(EncodeBenchmark, IntSlice)(benchmark::State &state) {
  std::vector<std::int32_t> values(static_cast<std::size_t>(state.range(0)));
  for (std::size_t i = 0; i < values.size(); ++i) {
    values[i] = static_cast<std::int32_t>(i * 37) - 1000;
  }
  std::vector<std::uint8_t> out;
  auto encoder = vc::codec::make_bytes_encoder(out, *handle_);
  for (auto _ : state) {
    out.clear();
    if (auto status = encoder.encode(values); !status) {
      state.SkipWithError(status.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(out.data());
  }
}
BENCHMARK_REGISTER_F(EncodeBenchmark, IntSlice)->Range(8, 8 << 10);

BENCHMARK_DEFINE_F(EncodeBenchmark, Marshal)(benchmark::State &state) {
  const auto order = make_order();
  for (auto _ : state) {
    auto bytes = vc::codec::marshal(order, *handle_);
    if (!bytes) {
      state.SkipWithError(bytes.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(bytes->data());
  }
}
BENCHMARK_REGISTER_F(EncodeBenchmark, Marshal);

BENCHMARK_MAIN();
