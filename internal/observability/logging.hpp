#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace callscribe::runtime::config {
class RuntimeConfig;
}

namespace callscribe::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the process-wide "callscribe" logger.

  Level and pattern come from CALLSCRIBE_LOG_LEVEL / CALLSCRIBE_LOG_PATTERN
  when set, otherwise from the logging section of the runtime config.
*/
void InitializeLogging(const callscribe::runtime::config::RuntimeConfig& config);
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

} // namespace callscribe::observability

#define CALLSCRIBE_LOG_DEBUG(message, ...) ::callscribe::observability::LogDebug((message), ##__VA_ARGS__)
#define CALLSCRIBE_LOG_INFO(message, ...) ::callscribe::observability::LogInfo((message), ##__VA_ARGS__)
#define CALLSCRIBE_LOG_WARN(message, ...) ::callscribe::observability::LogWarn((message), ##__VA_ARGS__)
#define CALLSCRIBE_LOG_ERROR(message, ...) ::callscribe::observability::LogError((message), ##__VA_ARGS__)
