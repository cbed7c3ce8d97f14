#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iterator>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/model/money.hpp"

namespace settle::observability {
namespace {

constexpr const char* kLoggerName     = "settlement-engine";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string FromEnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool NeedsQuotes(std::string_view value) {
  return value.empty() || value.find_first_of(" \t\"=\\") != std::string_view::npos;
}

void AppendValue(fmt::memory_buffer& out, std::string_view value) {
  if (!NeedsQuotes(value)) {
    out.append(value.data(), value.data() + value.size());
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('"');
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{}", value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField EurField(std::string_view key, std::int64_t cents) {
  return {std::string(key), model::FormatEur(cents)};
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  fmt::memory_buffer out;
  for (const auto& field : fields) {
    if (out.size() > 0) {
      out.push_back(' ');
    }
    fmt::format_to(std::back_inserter(out), "{}=", field.key);
    AppendValue(out, field.value);
  }
  return fmt::to_string(out);
}

void InitializeLogging(const settle::runtime::config::RuntimeConfig& config) {
  // Re-initialisation (tests, config reload) replaces the registered logger.
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(FromEnvOr("SETTLE_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(FromEnvOr("SETTLE_LOG_LEVEL", config.logging().level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }
  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, FormatFields(fields));
}

} // namespace settle::observability
