#pragma once

#include <chrono>
#include <deque>
#include <string>
#include <vector>

#include "log_record.h"

struct ExportInfo {
  std::chrono::system_clock::time_point date;
  std::string platform;
  std::string log_path;  // empty when there is no session log file
};

/**
 * @brief Export document: header block followed by one
 * "[timestamp LEVEL source target] message" line per record.
 */
std::string format_export(const std::vector<LogRecord>& records,
                          const ExportInfo& info);

/**
 * @brief Writes format_export() to `path` through a temporary file that is
 * renamed into place, so `path` is never left half-written.
 * @return true on success. Failures are reported on std::cerr.
 */
bool export_logs(const std::string& path, const std::vector<LogRecord>& records,
                 const ExportInfo& info);

std::string default_export_file_name(
    std::chrono::system_clock::time_point date);

std::string format_copy_text(const std::deque<LogRecord>& records);
std::string format_copy_text(const std::vector<LogRecord>& records);

// true for an http(s) URL; the console offers bug reports only then
bool bug_report_available(const std::string& issue_tracker_url);

/**
 * @brief Issue-tracker link pre-filled with environment info and the last
 * ERROR records.
 */
std::string build_bug_report_url(const std::string& issue_tracker_url,
                                 const std::vector<LogRecord>& records,
                                 const std::string& platform,
                                 const std::string& log_path);

// encodeURIComponent() semantics
std::string url_encode(const std::string& text);

/**
 * @brief Writes `content` to `path` via "<path>.tmp" and rename.
 */
bool write_file_atomically(const std::string& path, const std::string& content);
