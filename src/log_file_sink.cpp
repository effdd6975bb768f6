#include "log_file_sink.h"

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <iostream>

#include "sys_utils.h"

LogFileSink::LogFileSink(LogHub& hub, const std::filesystem::path& log_dir,
                         std::chrono::system_clock::time_point started) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir, ec);
  path_ = (log_dir / make_file_name(started)).string();

  file_.open(SysUtils::make_path_string(path_), std::ios::app);
  if (!file_.is_open()) {
    std::cerr << fmt::format(
                     "Failed to open log {}. File logging will be disabled.",
                     path_)
              << std::endl;
    return;
  }

  std::time_t started_time = std::chrono::system_clock::to_time_t(started);
  file_ << fmt::format("--- Session Started on {:%Y-%m-%d %X} ---",
                       fmt::localtime(started_time))
        << "\n"
        << std::endl;
  subscription_ = hub.subscribe([this](const LogEvent& event) {
    on_event(event);
  });
}

std::string LogFileSink::make_file_name(
    std::chrono::system_clock::time_point started) {
  std::time_t started_time = std::chrono::system_clock::to_time_t(started);
  return fmt::format("{}{:%Y-%m-%d_%H-%M-%S}{}", FILE_PREFIX,
                     fmt::localtime(started_time), FILE_EXTENSION);
}

size_t LogFileSink::remove_old_logs(const std::filesystem::path& log_dir,
                                    int retention_days) {
  if (retention_days <= 0) {
    return 0;
  }

  std::error_code ec;
  std::filesystem::directory_iterator it(log_dir, ec);
  if (ec) {
    return 0;
  }

  auto cutoff = std::filesystem::file_time_type::clock::now() -
                std::chrono::hours(24 * retention_days);
  size_t removed = 0;
  for (const auto& entry : it) {
    const std::filesystem::path& file = entry.path();
    std::string name = file.filename().string();
    if (!entry.is_regular_file(ec) || name.rfind(FILE_PREFIX, 0) != 0 ||
        file.extension() != FILE_EXTENSION) {
      continue;
    }
    auto modified = std::filesystem::last_write_time(file, ec);
    if (ec || modified >= cutoff) {
      continue;
    }
    if (std::filesystem::remove(file, ec)) {
      ++removed;
    } else {
      std::cerr << fmt::format("Warning: Cannot remove old log {}: {}", name,
                               ec.message())
                << std::endl;
    }
  }
  if (removed > 0) {
    std::clog << fmt::format("Removed {} log file(s) older than {} days.",
                             removed, retention_days)
              << std::endl;
  }
  return removed;
}

void LogFileSink::on_event(const LogEvent& event) {
  // the file is a journal; console clears do not touch it
  if (event.kind == LogEvent::Kind::Appended) {
    file_ << format_log_line(*event.record) << std::endl;
  }
}
