#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace shardfeed::runtime::config {
class RuntimeConfig;
}

namespace shardfeed::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
// Rendered in milliseconds, e.g. "delay=700ms".
LogField DurationField(std::string_view key, std::chrono::nanoseconds value);

/*
  Fields appended to every line logged from the current thread while the
  scope is alive. Scopes nest; a consumer run opens one with its shard and
  worker so processor callbacks inherit them too.
*/
class ScopedLogContext {
 public:
  explicit ScopedLogContext(std::initializer_list<LogField> fields);
  ~ScopedLogContext();

  ScopedLogContext(const ScopedLogContext&)            = delete;
  ScopedLogContext& operator=(const ScopedLogContext&) = delete;

 private:
  std::size_t restore_size_;
};

// Context fields active on this thread, outermost first.
const std::vector<LogField>& CurrentLogContext();

void InitializeLogging(const shardfeed::runtime::config::RuntimeConfig& config);
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

} // namespace shardfeed::observability

#define SHARDFEED_LOG_DEBUG(message, ...) ::shardfeed::observability::LogDebug((message), ##__VA_ARGS__)
#define SHARDFEED_LOG_INFO(message, ...) ::shardfeed::observability::LogInfo((message), ##__VA_ARGS__)
#define SHARDFEED_LOG_WARN(message, ...) ::shardfeed::observability::LogWarn((message), ##__VA_ARGS__)
#define SHARDFEED_LOG_ERROR(message, ...) ::shardfeed::observability::LogError((message), ##__VA_ARGS__)
