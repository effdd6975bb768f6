#include "log_record.h"

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string to_upper(std::string_view text) {
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return result;
}

}  // namespace

bool operator==(const LogRecord& lhs, const LogRecord& rhs) {
  return lhs.timestamp == rhs.timestamp && lhs.level == rhs.level &&
         lhs.target == rhs.target && lhs.message == rhs.message &&
         lhs.source == rhs.source;
}

bool operator!=(const LogRecord& lhs, const LogRecord& rhs) {
  return !(lhs == rhs);
}

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Trace:
      return "TRACE";
  }
  return "INFO";
}

const char* to_string(LogSource source) {
  return source == LogSource::Remote ? "remote" : "local";
}

const char* level_label(LogLevel level) {
  switch (level) {
    case LogLevel::Error:
      return "err";
    case LogLevel::Warn:
      return "warn";
    case LogLevel::Info:
      return "info";
    case LogLevel::Debug:
      return "dbg";
    case LogLevel::Trace:
      return "trc";
  }
  return "info";
}

std::optional<LogLevel> parse_level(std::string_view name) {
  std::string upper = to_upper(name);
  if (upper == "ERROR") return LogLevel::Error;
  if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
  if (upper == "INFO") return LogLevel::Info;
  if (upper == "DEBUG") return LogLevel::Debug;
  if (upper == "TRACE") return LogLevel::Trace;
  return std::nullopt;
}

LogLevel normalize_level(std::string_view name) {
  return parse_level(name).value_or(LogLevel::Info);
}

std::optional<LogSource> parse_source(std::string_view name) {
  std::string upper = to_upper(name);
  if (upper == "LOCAL") return LogSource::Local;
  if (upper == "REMOTE") return LogSource::Remote;
  return std::nullopt;
}

std::string make_timestamp(std::chrono::system_clock::time_point time_point) {
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    time_point.time_since_epoch())
                    .count() %
                1000;
  if (millis < 0) millis += 1000;
  std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
  return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03}", fmt::localtime(seconds),
                     millis);
}

std::string current_timestamp() {
  return make_timestamp(std::chrono::system_clock::now());
}

LogRecord make_record(LogLevel level, std::string target, std::string message,
                      LogSource source) {
  LogRecord record;
  record.timestamp = current_timestamp();
  record.level = level;
  record.target = std::move(target);
  record.message = std::move(message);
  record.source = source;
  return record;
}

std::string format_log_line(const LogRecord& record) {
  return fmt::format("[{} {} {}] {}", record.timestamp, to_string(record.level),
                     record.target, record.message);
}

std::optional<LogRecord> parse_log_line(std::string_view line,
                                        LogSource source) {
  LogRecord record;
  record.source = source;

  if (line.empty() || line.front() != '[') {
    record.level = LogLevel::Info;
    record.message = std::string(line);
    return record;
  }

  size_t close_bracket = line.find(']');
  if (close_bracket == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view header = line.substr(1, close_bracket - 1);
  std::string_view message = line.substr(close_bracket + 1);
  if (!message.empty() && message.front() == ' ') {
    message.remove_prefix(1);
  }
  record.message = std::string(message);

  // header: "<date> <time> <LEVEL> <target...>"
  size_t date_end = header.find(' ');
  size_t time_end = date_end == std::string_view::npos
                        ? std::string_view::npos
                        : header.find(' ', date_end + 1);
  if (time_end == std::string_view::npos) {
    record.timestamp = std::string(header);
    record.level = LogLevel::Info;
    return record;
  }

  record.timestamp = std::string(header.substr(0, time_end));
  std::string_view rest = header.substr(time_end + 1);
  size_t level_end = rest.find(' ');
  if (level_end == std::string_view::npos) {
    record.level = normalize_level(rest);
  } else {
    record.level = normalize_level(rest.substr(0, level_end));
    record.target = std::string(rest.substr(level_end + 1));
  }
  return record;
}

void to_json(json& j, const LogRecord& record) {
  j = json{{"timestamp", record.timestamp},
           {"level", to_string(record.level)},
           {"target", record.target},
           {"message", record.message},
           {"source", to_string(record.source)}};
}

void from_json(const json& j, LogRecord& record) {
  record.timestamp = j.value("timestamp", std::string());
  record.level = normalize_level(j.value("level", std::string("INFO")));
  record.target = j.value("target", std::string());
  record.message = j.value("message", std::string());
  record.source =
      parse_source(j.value("source", std::string())).value_or(LogSource::Local);
}
