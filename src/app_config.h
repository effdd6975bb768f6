#pragma once

#include <string>

#include "layout_store.h"
#include "log_buffer.h"
#include "remote_subscriber.h"
#include "window_launcher.h"

struct AppConfig {
  size_t buffer_capacity = LogBuffer::DEFAULT_CAPACITY;
  std::string remote_endpoint = RemoteSubscriber::DEFAULT_ENDPOINT;
  std::string remote_channel = RemoteSubscriber::DEFAULT_CHANNEL;
  int overscan = 20;
  std::string console_window_command = ProcessWindowLauncher::DEFAULT_COMMAND;
  std::string issue_tracker_url;
  CellMetrics cell_metrics;
  int log_retention_days = 7;
  std::string export_dir;  // empty: <config>/exports

  static inline const size_t MAX_BUFFER_CAPACITY = 100000;
  static inline const int MAX_OVERSCAN = 200;
  static inline const int MAX_CELL_PX = 64;
  static inline const int MAX_RETENTION_DAYS = 365;
};

/**
 * @brief Reads config.json. A missing file gives the defaults; every value is
 * validated, and an invalid one is replaced by its default with a warning.
 */
class ConfigManager {
 public:
  explicit ConfigManager(std::string file_path)
      : file_path_(std::move(file_path)) {}

  AppConfig load() const;

  // Writes the defaults if no file exists yet, so users can discover keys.
  bool write_defaults_if_missing() const;

  const std::string& file_path() const { return file_path_; }

 private:
  std::string file_path_;
};
