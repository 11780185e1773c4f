#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace shardfeed::observability {
namespace {

constexpr const char* kLoggerName     = "shardfeed";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

thread_local std::vector<LogField> t_context;

std::string ResolveLevel(const shardfeed::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("SHARDFEED_LOG_LEVEL")) {
    return level;
  }
  if (!config.logging().level().empty()) {
    return config.logging().level();
  }
  return kDefaultLevel;
}

std::string ResolvePattern(const shardfeed::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("SHARDFEED_LOG_PATTERN")) {
    return pattern;
  }
  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }
  return kDefaultPattern;
}

void AppendFields(std::ostringstream& out, const LogField* begin, const LogField* end) {
  for (const auto* field = begin; field != end; ++field) {
    if (out.tellp() > 0) {
      out << ' ';
    }
    out << field->key << '=' << field->value;
  }
}

// Call-site fields first, then the thread's context.
std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  AppendFields(out, fields.begin(), fields.end());
  AppendFields(out, t_context.data(), t_context.data() + t_context.size());
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DurationField(std::string_view key, std::chrono::nanoseconds value) {
  return {std::string(key), std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(value).count()) + "ms"};
}

ScopedLogContext::ScopedLogContext(std::initializer_list<LogField> fields) : restore_size_(t_context.size()) {
  t_context.insert(t_context.end(), fields.begin(), fields.end());
}

ScopedLogContext::~ScopedLogContext() {
  t_context.resize(restore_size_);
}

const std::vector<LogField>& CurrentLogContext() {
  return t_context;
}

void InitializeLogging(const shardfeed::runtime::config::RuntimeConfig& config) {
  // re-initialization reconfigures the existing logger
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
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

  auto serialized_fields = SerializeFields(fields);
  if (serialized_fields.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, serialized_fields);
}

} // namespace shardfeed::observability
