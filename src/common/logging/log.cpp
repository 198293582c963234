#include "common/logging/log.hpp"

#include <gflags/gflags.h>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <utility>
#include <vector>

DECLARE_string(log_level);
DECLARE_string(log_file);
DECLARE_int32(log_max_size);
DECLARE_int32(log_max_files);
DECLARE_bool(log_stderr);

namespace {

constexpr std::size_t kMinFileSize = 1024;

std::shared_ptr<spdlog::sinks::sink> create_file_sink(const std::string& file_path,
                                                      size_t max_size,
                                                      int max_files) {
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file_path, std::max(max_size, kMinFileSize), std::max(max_files, 1));
}

auto invalid(std::string message) -> tl::unexpected<vc::codec::EncodeError> {
  return tl::unexpected(
      vc::codec::make_error(vc::codec::ErrorCode::InvalidConfig, std::move(message)));
}

}  // namespace

namespace vc::log {

namespace {
  std::shared_ptr<spdlog::async_logger> g_logger;
  bool g_initialized = false;
}

auto parse_level(std::string_view name) -> codec::Expected<spdlog::level::level_enum> {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "warn") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off") return spdlog::level::off;
  return invalid(std::format("unknown log level: {}", name));
}

auto options_from_flags() -> codec::Expected<LogOptions> {
  auto level = parse_level(FLAGS_log_level);
  if (!level) {
    return tl::unexpected(level.error());
  }
  if (FLAGS_log_max_size < 0) {
    return invalid("--log_max_size must not be negative");
  }
  LogOptions options;
  options.level = *level;
  options.file = FLAGS_log_file;
  options.max_size = static_cast<std::size_t>(FLAGS_log_max_size);
  options.max_files = FLAGS_log_max_files;
  options.to_stderr = FLAGS_log_stderr;
  return options;
}

auto parse_log_options(const codec::Json& json) -> codec::Expected<LogOptions> {
  if (!json.is_object()) {
    return invalid("log options must be an object");
  }
  LogOptions options;
  if (auto it = json.find("level"); it != json.end()) {
    if (!it->is_string()) {
      return invalid("level must be a string");
    }
    auto level = parse_level(it->get<std::string>());
    if (!level) {
      return tl::unexpected(level.error());
    }
    options.level = *level;
  }
  if (auto it = json.find("file"); it != json.end()) {
    if (!it->is_string() || it->get<std::string>().empty()) {
      return invalid("file must be a non-empty string");
    }
    options.file = it->get<std::string>();
  }
  if (auto it = json.find("max_size"); it != json.end()) {
    if (!it->is_number_unsigned()) {
      return invalid("max_size must be an unsigned integer");
    }
    options.max_size = it->get<std::size_t>();
  }
  if (auto it = json.find("max_files"); it != json.end()) {
    if (!it->is_number_integer() || it->get<std::int64_t>() < 1) {
      return invalid("max_files must be a positive integer");
    }
    options.max_files = it->get<int>();
  }
  if (auto it = json.find("stderr"); it != json.end()) {
    if (!it->is_boolean()) {
      return invalid("stderr must be a boolean");
    }
    options.to_stderr = it->get<bool>();
  }
  return options;
}

auto init() -> codec::Status {
  auto options = options_from_flags();
  if (!options) {
    return tl::unexpected(options.error());
  }
  return init(*options);
}

auto init(const LogOptions& options) -> codec::Status {
  if (g_initialized) {
    return {};
  }

  std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;
  try {
    auto file_sink = create_file_sink(options.file, options.max_size, options.max_files);
    file_sink->set_level(options.level);
    sinks.push_back(file_sink);
  } catch (const spdlog::spdlog_ex& e) {
    return tl::unexpected(codec::make_error(
        codec::ErrorCode::Io, std::format("cannot open log file {}: {}", options.file, e.what())));
  }

  // Warnings and errors also go to the terminal for command line tools.
  if (options.to_stderr) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(std::max(options.level, spdlog::level::warn));
    sinks.push_back(console_sink);
  }

  spdlog::init_thread_pool(8192, 1);
  g_logger = std::make_shared<spdlog::async_logger>(
      "vcodec", sinks.begin(), sinks.end(), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(g_logger);
  spdlog::set_level(options.level);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

  g_initialized = true;
  spdlog::info("vcodec logger initialized: file={}, level={}, stderr={}", options.file,
               spdlog::level::to_string_view(options.level), options.to_stderr);
  return {};
}

void shutdown() {
  if (g_logger) {
    g_logger->flush();
    spdlog::shutdown();
    g_logger.reset();
    g_initialized = false;
  }
}

void info(std::string_view event, const Fields& fields) {
  std::string msg{event};
  for (const auto& [key, value] : fields) {
    msg += " " + key + "=" + value;
  }
  spdlog::info(msg);
}

void encode_failure(std::string_view context, const codec::EncodeError& error) {
  spdlog::error("{} failed: code={} message={}", context, codec::error_code_name(error.code),
                error.message);
}

}  // namespace vc::log
