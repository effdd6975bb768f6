#include "log_export.h"

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <filesystem>
#include <fstream>
#include <iostream>

#include "sys_utils.h"

namespace {

const size_t BUG_REPORT_ERROR_COUNT = 10;

std::string iso_date_time(std::chrono::system_clock::time_point date) {
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    date.time_since_epoch())
                    .count() %
                1000;
  std::time_t seconds = std::chrono::system_clock::to_time_t(date);
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(seconds),
                     millis);
}

template <typename Records>
std::string join_copy_lines(const Records& records) {
  std::string text;
  for (const auto& record : records) {
    if (!text.empty()) text += '\n';
    text += fmt::format("[{} {} {}] {}", record.timestamp,
                        to_string(record.level), record.target,
                        record.message);
  }
  return text;
}

}  // namespace

std::string format_export(const std::vector<LogRecord>& records,
                          const ExportInfo& info) {
  std::string text = fmt::format(
      "=== LogDock Log Export ===\n"
      "Date: {}\n"
      "Platform: {}\n"
      "Log file: {}\n"
      "Total entries: {}\n"
      "\n"
      "=== LOGS ===\n"
      "\n",
      iso_date_time(info.date), info.platform,
      info.log_path.empty() ? "unknown" : info.log_path, records.size());

  for (size_t i = 0; i < records.size(); ++i) {
    const LogRecord& record = records[i];
    if (i > 0) text += '\n';
    text += fmt::format("[{} {} {} {}] {}", record.timestamp,
                        to_string(record.level), to_string(record.source),
                        record.target, record.message);
  }
  return text;
}

bool write_file_atomically(const std::string& path,
                           const std::string& content) {
  std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(SysUtils::make_path_string(tmp_path),
                      std::ios::binary | std::ios::trunc);
    if (!out) {
      std::cerr << fmt::format("Failed to open {} for writing.", tmp_path)
                << std::endl;
      return false;
    }
    out << content;
    out.flush();
    if (!out) {
      std::cerr << fmt::format("Failed to write {}.", tmp_path) << std::endl;
      out.close();
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::cerr << fmt::format("Failed to move {} into place: {}", path,
                             ec.message())
              << std::endl;
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    return false;
  }
  return true;
}

bool export_logs(const std::string& path, const std::vector<LogRecord>& records,
                 const ExportInfo& info) {
  if (!write_file_atomically(path, format_export(records, info))) {
    std::cerr << fmt::format("Failed to export logs to {}.", path) << std::endl;
    return false;
  }
  std::clog << fmt::format("Exported {} log entries to {}.", records.size(),
                           path)
            << std::endl;
  return true;
}

std::string default_export_file_name(
    std::chrono::system_clock::time_point date) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(date);
  return fmt::format("logdock-logs-{:%Y-%m-%d}.log", fmt::gmtime(seconds));
}

std::string format_copy_text(const std::deque<LogRecord>& records) {
  return join_copy_lines(records);
}

std::string format_copy_text(const std::vector<LogRecord>& records) {
  return join_copy_lines(records);
}

std::string url_encode(const std::string& text) {
  static const char* HEX = "0123456789ABCDEF";
  std::string result;
  result.reserve(text.size() * 3);
  for (unsigned char c : text) {
    bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                      (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                      c == '.' || c == '!' || c == '~' || c == '*' ||
                      c == '\'' || c == '(' || c == ')';
    if (unreserved) {
      result += static_cast<char>(c);
    } else {
      result += '%';
      result += HEX[c >> 4];
      result += HEX[c & 0x0F];
    }
  }
  return result;
}

bool bug_report_available(const std::string& issue_tracker_url) {
  return issue_tracker_url.rfind("https://", 0) == 0 ||
         issue_tracker_url.rfind("http://", 0) == 0;
}

std::string build_bug_report_url(const std::string& issue_tracker_url,
                                 const std::vector<LogRecord>& records,
                                 const std::string& platform,
                                 const std::string& log_path) {
  std::vector<const LogRecord*> errors;
  for (auto it = records.rbegin();
       it != records.rend() && errors.size() < BUG_REPORT_ERROR_COUNT; ++it) {
    if (it->level == LogLevel::Error) {
      errors.push_back(&*it);
    }
  }

  std::string error_lines;
  for (auto it = errors.rbegin(); it != errors.rend(); ++it) {
    if (!error_lines.empty()) error_lines += '\n';
    error_lines += fmt::format("[{}] {}", (*it)->timestamp, (*it)->message);
  }

  std::string body = fmt::format(
      "\n"
      "## Description\n"
      "<!-- Describe the bug -->\n"
      "\n"
      "## Steps to Reproduce\n"
      "1.\n"
      "2.\n"
      "3.\n"
      "\n"
      "## Expected Behavior\n"
      "<!-- What should happen -->\n"
      "\n"
      "## Actual Behavior\n"
      "<!-- What actually happens -->\n"
      "\n"
      "## Environment\n"
      "- Platform: {}\n"
      "- Log file: {}\n"
      "\n"
      "## Recent Errors\n"
      "```\n"
      "{}\n"
      "```\n",
      platform, log_path.empty() ? "unknown" : log_path,
      error_lines.empty() ? "No recent errors" : error_lines);

  return fmt::format("{}?labels=bug&body={}", issue_tracker_url,
                     url_encode(body));
}
