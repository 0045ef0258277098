#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/model/person_pair.hpp"

namespace collab::runtime::config {
class RuntimeConfig;
}

namespace collab::observability {

/*
  Structured key=value field appended to a log line.

  Values containing spaces, quotes or '=' are emitted quoted so lines stay
  machine-splittable.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// "low:high"
LogField PairField(std::string_view key, const model::PersonPair& pair);

void InitializeLogging(const collab::runtime::config::RuntimeConfig& config);
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

} // namespace collab::observability

#define COLLAB_LOG_DEBUG(message, ...) ::collab::observability::LogDebug((message), ##__VA_ARGS__)
#define COLLAB_LOG_INFO(message, ...) ::collab::observability::LogInfo((message), ##__VA_ARGS__)
#define COLLAB_LOG_WARN(message, ...) ::collab::observability::LogWarn((message), ##__VA_ARGS__)
#define COLLAB_LOG_ERROR(message, ...) ::collab::observability::LogError((message), ##__VA_ARGS__)
