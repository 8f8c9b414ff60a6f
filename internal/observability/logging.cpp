#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace chronicle::observability {
namespace {

constexpr const char* kLoggerName     = "chronicle";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string ResolveLevelText(const chronicle::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("CHRONICLE_LOG_LEVEL")) {
    return level;
  }
  return config.logging().level();
}

std::string ResolvePattern(const chronicle::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("CHRONICLE_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return kDefaultPattern;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '"' || c == '=') return true;
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    if (c == '\n') {
      out.append("\\n");
      continue;
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

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view text) {
  if (text == "warning") return spdlog::level::warn;
  if (text == "error") return spdlog::level::err;

  // from_str maps anything it does not know to off
  const auto level = spdlog::level::from_str(std::string(text));
  if (level == spdlog::level::off && text != "off") return std::nullopt;
  return level;
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

void InitializeLogging(const chronicle::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName); // stdout carries command output
  }
  logger->set_pattern(ResolvePattern(config));

  const auto level_text = ResolveLevelText(config);
  const auto level      = ParseLogLevel(level_text);
  logger->set_level(level.value_or(spdlog::level::info));

  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (!level_text.empty() && !level) {
    LogWarn("unknown log level, using info", {StringField("level", level_text)});
  }
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

} // namespace chronicle::observability
