#include "app_config.h"

#include <fmt/core.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "log_export.h"
#include "sys_utils.h"

using json = nlohmann::json;

namespace {

template <typename T>
T read_clamped(const json& data, const std::string& key, T fallback, T lo,
               T hi) {
  auto it = data.find(key);
  if (it == data.end()) {
    return fallback;
  }
  if (!it->is_number()) {
    std::cerr << fmt::format("Warning: config key \"{}\" must be a number.",
                             key)
              << std::endl;
    return fallback;
  }
  double value = std::clamp(it->get<double>(), static_cast<double>(lo),
                            static_cast<double>(hi));
  return static_cast<T>(value);
}

std::string read_string(const json& data, const std::string& key,
                        const std::string& fallback, bool allow_empty) {
  auto it = data.find(key);
  if (it == data.end()) {
    return fallback;
  }
  if (!it->is_string() || (!allow_empty && it->get<std::string>().empty())) {
    std::cerr << fmt::format(
                     "Warning: config key \"{}\" must be a{} string.", key,
                     allow_empty ? "" : " non-empty")
              << std::endl;
    return fallback;
  }
  return it->get<std::string>();
}

}  // namespace

AppConfig ConfigManager::load() const {
  AppConfig config;

  std::ifstream file(SysUtils::make_path_string(file_path_));
  if (!file.is_open()) {
    std::clog << fmt::format("Config file {} not found. Using defaults.",
                             file_path_)
              << std::endl;
    return config;
  }

  json data;
  try {
    data = json::parse(file);
  } catch (const json::parse_error& e) {
    std::cerr << fmt::format(
                     "Error parsing config file {}. Using defaults. "
                     "Details: {}",
                     file_path_, e.what())
              << std::endl;
    return config;
  }
  if (!data.is_object()) {
    std::cerr << fmt::format("Config file {} is not an object. Using defaults.",
                             file_path_)
              << std::endl;
    return config;
  }

  config.buffer_capacity =
      read_clamped<size_t>(data, "buffer_capacity", config.buffer_capacity, 1,
                           AppConfig::MAX_BUFFER_CAPACITY);
  config.remote_endpoint =
      read_string(data, "remote_endpoint", config.remote_endpoint, false);
  config.remote_channel =
      read_string(data, "remote_channel", config.remote_channel, false);
  config.overscan = read_clamped<int>(data, "overscan", config.overscan, 0,
                                      AppConfig::MAX_OVERSCAN);

  std::string command = read_string(data, "console_window_command",
                                    config.console_window_command, false);
  if (command.find("{endpoint}") == std::string::npos) {
    std::cerr << "Warning: console_window_command must contain {endpoint}. "
                 "Using the default."
              << std::endl;
  } else {
    config.console_window_command = command;
  }

  std::string tracker =
      read_string(data, "issue_tracker_url", config.issue_tracker_url, true);
  if (!tracker.empty() && !bug_report_available(tracker)) {
    std::cerr << "Warning: issue_tracker_url must be an http(s) URL. Bug "
                 "reports are disabled."
              << std::endl;
  } else {
    config.issue_tracker_url = tracker;
  }
  config.cell_metrics.cell_width_px =
      read_clamped<int>(data, "cell_width_px",
                        config.cell_metrics.cell_width_px, 1,
                        AppConfig::MAX_CELL_PX);
  config.cell_metrics.cell_height_px =
      read_clamped<int>(data, "cell_height_px",
                        config.cell_metrics.cell_height_px, 1,
                        AppConfig::MAX_CELL_PX);
  config.log_retention_days =
      read_clamped<int>(data, "log_retention_days", config.log_retention_days,
                        0, AppConfig::MAX_RETENTION_DAYS);
  config.export_dir = read_string(data, "export_dir", config.export_dir, true);

  std::clog << fmt::format("Config loaded from {}.", file_path_) << std::endl;
  return config;
}

bool ConfigManager::write_defaults_if_missing() const {
  std::error_code ec;
  if (std::filesystem::exists(file_path_, ec)) {
    return true;
  }

  AppConfig defaults;
  json data = {
      {"buffer_capacity", defaults.buffer_capacity},
      {"remote_endpoint", defaults.remote_endpoint},
      {"remote_channel", defaults.remote_channel},
      {"overscan", defaults.overscan},
      {"console_window_command", defaults.console_window_command},
      {"issue_tracker_url", defaults.issue_tracker_url},
      {"cell_width_px", defaults.cell_metrics.cell_width_px},
      {"cell_height_px", defaults.cell_metrics.cell_height_px},
      {"log_retention_days", defaults.log_retention_days},
      {"export_dir", defaults.export_dir},
  };
  return write_file_atomically(file_path_, data.dump(4));
}
