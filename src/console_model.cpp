#include "console_model.h"

#include "log_export.h"

ConsoleModel::ConsoleModel(LogHub& hub, int row_height, int overscan)
    : hub_(hub), virtualizer_(row_height, overscan) {}

void ConsoleModel::attach() {
  if (is_live()) return;
  rebuild();
  subscription_ =
      hub_.subscribe([this](const LogEvent& event) { on_event(event); });
}

void ConsoleModel::detach() {
  subscription_.dispose();
  rows_.clear();
  virtualizer_.on_rows_reset(0);
}

void ConsoleModel::set_criteria(const FilterCriteria& criteria) {
  if (criteria == compiled_.criteria()) return;
  compiled_ = CompiledCriteria(criteria);
  if (is_live()) {
    rebuild();
  }
}

std::string ConsoleModel::copy_text() const { return format_copy_text(rows_); }

void ConsoleModel::rebuild() {
  rows_.clear();
  for (auto& record : hub_.snapshot()) {
    if (compiled_.matches(record)) {
      rows_.push_back(std::move(record));
    }
  }
  virtualizer_.on_rows_reset(rows_.size());
}

void ConsoleModel::on_event(const LogEvent& event) {
  switch (event.kind) {
    case LogEvent::Kind::Appended:
      // the evicted record is the oldest overall, so if it matched it is
      // also our oldest row
      if (event.evicted && compiled_.matches(*event.evicted) &&
          !rows_.empty()) {
        rows_.pop_front();
      }
      if (compiled_.matches(*event.record)) {
        rows_.push_back(*event.record);
      }
      virtualizer_.on_rows_appended(rows_.size());
      break;
    case LogEvent::Kind::Cleared:
      rows_.clear();
      virtualizer_.on_rows_reset(0);
      break;
    case LogEvent::Kind::Reset:
      rebuild();
      break;
  }
}
