#include <cstdint>
#include <exception>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <gflags/gflags.h>

#include "codec/encoder.hpp"
#include "codec/msgpack.hpp"
#include "common/logging/log.hpp"

DEFINE_string(input, "-", "JSON document to encode, '-' reads stdin");
DEFINE_string(output, "", "File for the msgpack bytes; hex goes to stdout when empty");
DEFINE_string(options, "", "JSON object with encoder options, e.g. {\"raw_as_string\": true}");
DEFINE_bool(write_ext, true, "Write extension payloads as tagged extension blobs");

namespace {

auto read_input(const std::string &path) -> vc::codec::Expected<vc::codec::Json> {
  try {
    if (path == "-") {
      return vc::codec::Json::parse(std::cin);
    }
    std::ifstream file(path);
    if (!file) {
      return tl::unexpected(
          vc::codec::make_error(vc::codec::ErrorCode::Io, std::format("cannot open {}", path)));
    }
    return vc::codec::Json::parse(file);
  } catch (const std::exception &e) {
    return tl::unexpected(vc::codec::make_error(vc::codec::ErrorCode::InvalidConfig,
                                                std::format("invalid JSON input: {}", e.what())));
  }
}

auto load_options() -> vc::codec::Expected<vc::codec::MsgpackOptions> {
  if (FLAGS_options.empty()) {
    return vc::codec::MsgpackOptions{};
  }
  auto json = vc::codec::Json::parse(FLAGS_options, nullptr, false);
  if (json.is_discarded()) {
    return tl::unexpected(
        vc::codec::make_error(vc::codec::ErrorCode::InvalidConfig, "--options is not valid JSON"));
  }
  return vc::codec::parse_msgpack_options(json);
}

auto to_hex(const std::vector<std::uint8_t> &bytes) -> std::string {
  std::string text;
  text.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    text += std::format("{:02x}", byte);
  }
  return text;
}

auto run() -> vc::codec::Status {
  auto document = read_input(FLAGS_input);
  if (!document) {
    return tl::unexpected(document.error());
  }
  auto options = load_options();
  if (!options) {
    return tl::unexpected(options.error());
  }

  auto handle = vc::codec::make_msgpack_handle(*options, {.write_ext = FLAGS_write_ext});
  auto bytes = vc::codec::marshal(*document, *handle);
  if (!bytes) {
    return tl::unexpected(bytes.error());
  }
  vc::log::info("encoded", {{"input", FLAGS_input}, {"bytes", std::to_string(bytes->size())}});

  if (FLAGS_output.empty()) {
    std::cout << to_hex(*bytes) << '\n';
    return {};
  }
  std::ofstream file(FLAGS_output, std::ios::binary | std::ios::trunc);
  vc::codec::OstreamWriter writer(file);
  if (auto written = writer.write(*bytes); !written) {
    return tl::unexpected(written.error());
  }
  return writer.flush();
}

}  // namespace

int main(int argc, char **argv) {
  gflags::SetUsageMessage("encode_json --input doc.json [--output doc.msgpack]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  if (auto logging = vc::log::init(); !logging) {
    std::cerr << std::format("error: {}\n", logging.error().message);
    return 1;
  }

  auto status = run();
  if (!status) {
    vc::log::encode_failure("encode_json", status.error());
    std::cerr << std::format("error: {}\n", status.error().message);
    vc::log::shutdown();
    return 1;
  }
  vc::log::shutdown();
  return 0;
}
