#pragma once

#include <fmt/core.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "log_hub.h"

namespace fs = std::filesystem;

namespace test_utils {

// Records everything published to it.
class CollectingSink : public RecordSink {
 public:
  void publish(const LogRecord& record) override { records.push_back(record); }

  std::vector<LogRecord> records;
};

inline LogRecord make_test_record(LogLevel level, const std::string& message,
                                  LogSource source = LogSource::Local,
                                  const std::string& target = "test") {
  LogRecord record;
  record.timestamp = "2024-05-01 12:00:00.000";
  record.level = level;
  record.target = target;
  record.message = message;
  record.source = source;
  return record;
}

// Numbered INFO records "msg-0" .. "msg-<count-1>".
inline std::vector<LogRecord> make_numbered_records(size_t count,
                                                    size_t first = 0) {
  std::vector<LogRecord> records;
  for (size_t i = first; i < first + count; ++i) {
    records.push_back(make_test_record(LogLevel::Info, fmt::format("msg-{}", i)));
  }
  return records;
}

inline std::string read_file_contents(const fs::path& path) {
  std::ifstream in(path);
  if (!in.is_open()) return "";
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline void write_file_contents(const fs::path& path,
                                const std::string& content) {
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

// Fresh directory under the system temp dir, removed when destroyed.
class TempDir {
 public:
  explicit TempDir(const std::string& name)
      : path_(fs::temp_directory_path() /
              fmt::format("logdock_{}_{}", name, getpid())) {
    std::error_code ec;
    fs::remove_all(path_, ec);
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  const fs::path& path() const { return path_; }
  fs::path operator/(const std::string& name) const { return path_ / name; }

 private:
  fs::path path_;
};

}  // namespace test_utils
