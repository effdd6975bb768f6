#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "log_hub.h"

// Appends every record of a hub to this session's log file.
class LogFileSink {
 public:
  static inline const std::string FILE_PREFIX = "logdock_";
  static inline const std::string FILE_EXTENSION = ".log";

  /**
   * @brief Creates <log_dir>/logdock_YYYY-MM-DD_HH-MM-SS.log and starts
   * following `hub`. Check is_open() afterwards.
   */
  LogFileSink(LogHub& hub, const std::filesystem::path& log_dir,
              std::chrono::system_clock::time_point started =
                  std::chrono::system_clock::now());

  LogFileSink(const LogFileSink&) = delete;
  LogFileSink& operator=(const LogFileSink&) = delete;

  bool is_open() const { return file_.is_open(); }
  const std::string& path() const { return path_; }

  static std::string make_file_name(
      std::chrono::system_clock::time_point started);

  /**
   * @brief Deletes session logs in `log_dir` last written more than
   * `retention_days` ago. 0 keeps everything.
   * @return number of files removed.
   */
  static size_t remove_old_logs(const std::filesystem::path& log_dir,
                                int retention_days);

 private:
  void on_event(const LogEvent& event);

  std::ofstream file_;
  std::string path_;
  Subscription subscription_;
};
