#pragma once

#include <deque>
#include <string>

#include "log_hub.h"
#include "query_engine.h"
#include "virtualizer.h"

/**
 * @brief View state of one console: the filtered rows and their scroll
 * geometry.
 *
 * While live, the model follows its hub and updates incrementally: an append
 * costs one predicate test (two when a record is evicted). The full buffer is
 * walked only when the criteria change or the model is (re)attached.
 */
class ConsoleModel {
 public:
  ConsoleModel(LogHub& hub, int row_height, int overscan);

  ConsoleModel(const ConsoleModel&) = delete;
  ConsoleModel& operator=(const ConsoleModel&) = delete;

  /**
   * @brief Rebuilds from the hub snapshot and starts following it.
   */
  void attach();

  /**
   * @brief Stops following the hub. The rows are dropped.
   */
  void detach();
  bool is_live() const { return subscription_.active(); }

  void set_criteria(const FilterCriteria& criteria);
  const FilterCriteria& criteria() const { return compiled_.criteria(); }

  const std::deque<LogRecord>& rows() const { return rows_; }
  Virtualizer& virtualizer() { return virtualizer_; }
  const Virtualizer& virtualizer() const { return virtualizer_; }

  size_t error_count() const { return hub_.buffer().count(LogLevel::Error); }
  size_t warn_count() const { return hub_.buffer().count(LogLevel::Warn); }
  size_t total_count() const { return hub_.buffer().size(); }

  /**
   * @brief Filtered rows as "[timestamp LEVEL target] message" lines.
   */
  std::string copy_text() const;

  LogHub& hub() { return hub_; }

 private:
  void rebuild();
  void on_event(const LogEvent& event);

  LogHub& hub_;
  CompiledCriteria compiled_;
  std::deque<LogRecord> rows_;
  Virtualizer virtualizer_;
  Subscription subscription_;
};
