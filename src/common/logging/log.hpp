#pragma once

#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "codec/error.hpp"
#include "codec/value.hpp"

namespace vc::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Logger configuration. Command line tools fill it from the --log_* flags.
struct LogOptions {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string file = "vcodec.log";
  std::size_t max_size = 10485760;
  int max_files = 3;
  /// Mirror warnings and errors to stderr.
  bool to_stderr = false;
};

auto parse_level(std::string_view name) -> codec::Expected<spdlog::level::level_enum>;

auto options_from_flags() -> codec::Expected<LogOptions>;

/// Reads {"level", "file", "max_size", "max_files", "stderr"}; absent keys
/// keep their defaults.
auto parse_log_options(const codec::Json &json) -> codec::Expected<LogOptions>;

/// Installs the process-wide async logger configured by the --log_* flags.
auto init() -> codec::Status;

auto init(const LogOptions &options) -> codec::Status;

void shutdown();

using Fields = std::vector<std::pair<std::string, std::string>>;

/// One line: event followed by key=value pairs in the order given.
void info(std::string_view event, const Fields &fields);

/// Logs a failed encode at error level with its code name.
void encode_failure(std::string_view context, const codec::EncodeError &error);

}  // namespace vc::log
