#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace settle::runtime::config {
class RuntimeConfig;
}

namespace settle::observability {

/*
  Structured log lines in logfmt:

    settlement batch committed batch_id=7 use_case=mieterstrom suppressed_eur=0.27

  Values containing spaces, quotes or '=' are double-quoted with '"' and '\'
  escaped, so a line can be split back into fields.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);
// Integer cents rendered as EUR with two decimals ("2.80", "-0.05").
LogField EurField(std::string_view key, std::int64_t cents);

std::string FormatFields(std::initializer_list<LogField> fields);

// Level and pattern from config; SETTLE_LOG_LEVEL / SETTLE_LOG_PATTERN win.
void InitializeLogging(const settle::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace settle::observability

#define SETTLE_LOG_DEBUG(message, ...) ::settle::observability::LogDebug((message), ##__VA_ARGS__)
#define SETTLE_LOG_INFO(message, ...) ::settle::observability::LogInfo((message), ##__VA_ARGS__)
#define SETTLE_LOG_WARN(message, ...) ::settle::observability::LogWarn((message), ##__VA_ARGS__)
#define SETTLE_LOG_ERROR(message, ...) ::settle::observability::LogError((message), ##__VA_ARGS__)
