#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

namespace waterfall::runtime::config {
class RuntimeConfig;
}

namespace waterfall::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DateField(std::string_view key, util::Date value);
LogField AmountField(std::string_view key, util::Amount value);

void InitializeLogging(const waterfall::runtime::config::RuntimeConfig& config);
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

} // namespace waterfall::observability

#define WATERFALL_LOG_DEBUG(message, ...) ::waterfall::observability::LogDebug((message), ##__VA_ARGS__)
#define WATERFALL_LOG_INFO(message, ...) ::waterfall::observability::LogInfo((message), ##__VA_ARGS__)
#define WATERFALL_LOG_WARN(message, ...) ::waterfall::observability::LogWarn((message), ##__VA_ARGS__)
#define WATERFALL_LOG_ERROR(message, ...) ::waterfall::observability::LogError((message), ##__VA_ARGS__)
