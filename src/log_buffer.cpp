#include "log_buffer.h"

#include <stdexcept>

LogBuffer::LogBuffer(size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("LogBuffer capacity must be positive");
  }
}

std::optional<LogRecord> LogBuffer::append(LogRecord record) {
  std::optional<LogRecord> evicted;
  if (records_.size() >= capacity_) {
    evicted = std::move(records_.front());
    records_.pop_front();
    level_counts_[static_cast<size_t>(evicted->level)]--;
  }
  level_counts_[static_cast<size_t>(record.level)]++;
  records_.push_back(std::move(record));
  return evicted;
}

std::vector<LogRecord> LogBuffer::snapshot() const {
  return std::vector<LogRecord>(records_.begin(), records_.end());
}

void LogBuffer::clear() {
  records_.clear();
  level_counts_.fill(0);
}

void LogBuffer::replace(const std::vector<LogRecord>& records) {
  clear();
  size_t skip = records.size() > capacity_ ? records.size() - capacity_ : 0;
  for (size_t i = skip; i < records.size(); ++i) {
    append(records[i]);
  }
}
