#pragma once

#include <array>
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

#include "log_record.h"

// Fixed-capacity FIFO store of log records, oldest first.
class LogBuffer {
 public:
  static inline const size_t DEFAULT_CAPACITY = 1000;

  explicit LogBuffer(size_t capacity = DEFAULT_CAPACITY);

  /**
   * @return the record evicted to make room, if the buffer was full.
   */
  std::optional<LogRecord> append(LogRecord record);

  /**
   * @brief Copy of the buffered records, oldest to newest.
   */
  std::vector<LogRecord> snapshot() const;

  void clear();

  /**
   * @brief Replaces the content with the newest `capacity()` records of
   * `records`.
   */
  void replace(const std::vector<LogRecord>& records);

  size_t size() const { return records_.size(); }
  size_t capacity() const { return capacity_; }
  bool empty() const { return records_.empty(); }
  size_t count(LogLevel level) const {
    return level_counts_[static_cast<size_t>(level)];
  }

  const LogRecord& at(size_t index) const { return records_.at(index); }

 private:
  size_t capacity_;
  std::deque<LogRecord> records_;
  std::array<size_t, 5> level_counts_{};
};
