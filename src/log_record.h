#pragma once

#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

enum class LogLevel { Error, Warn, Info, Debug, Trace };

enum class LogSource { Local, Remote };

// One normalized log line. Never modified after it is captured.
struct LogRecord {
  std::string timestamp;  // "YYYY-MM-DD HH:MM:SS.mmm", sortable as text
  LogLevel level = LogLevel::Info;
  std::string target;
  std::string message;
  LogSource source = LogSource::Local;
};

bool operator==(const LogRecord& lhs, const LogRecord& rhs);
bool operator!=(const LogRecord& lhs, const LogRecord& rhs);

inline constexpr LogLevel ALL_LEVELS[] = {LogLevel::Error, LogLevel::Warn,
                                          LogLevel::Info, LogLevel::Debug,
                                          LogLevel::Trace};

const char* to_string(LogLevel level);
const char* to_string(LogSource source);

/**
 * @brief Short label shown in the console rows ("err", "warn", ...).
 */
const char* level_label(LogLevel level);

/**
 * @return the level for a case-insensitive name, accepting "WARNING" as Warn.
 */
std::optional<LogLevel> parse_level(std::string_view name);

/**
 * @brief Like parse_level(), but unknown names become Info.
 */
LogLevel normalize_level(std::string_view name);

std::optional<LogSource> parse_source(std::string_view name);

std::string make_timestamp(std::chrono::system_clock::time_point time_point);
std::string current_timestamp();

LogRecord make_record(LogLevel level, std::string target, std::string message,
                      LogSource source);

/**
 * @brief Session log file format: "[timestamp LEVEL target] message".
 */
std::string format_log_line(const LogRecord& record);

/**
 * @brief Parses a line written by format_log_line().
 *
 * Lines that do not start with '[' become an Info record carrying the whole
 * line. A header with fewer than three parts is kept as the timestamp.
 * @return std::nullopt only when a '[' is never closed.
 */
std::optional<LogRecord> parse_log_line(std::string_view line,
                                        LogSource source = LogSource::Remote);

void to_json(nlohmann::json& j, const LogRecord& record);
void from_json(const nlohmann::json& j, LogRecord& record);
