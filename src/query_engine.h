#pragma once

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "log_record.h"

enum class SourceFilter { All, Local, Remote };

struct FilterCriteria {
  SourceFilter source = SourceFilter::All;
  std::optional<LogLevel> level;  // std::nullopt: any level
  std::string text;               // "/pattern/" is a regular expression

  bool operator==(const FilterCriteria& other) const {
    return source == other.source && level == other.level &&
           text == other.text;
  }
  bool operator!=(const FilterCriteria& other) const {
    return !(*this == other);
  }
};

/**
 * @brief Criteria prepared for repeated matching: lowercased needle or
 * compiled pattern.
 */
class CompiledCriteria {
 public:
  // std::regex recurses per input character; longer fields only match the
  // pattern against their first MAX_REGEX_INPUT bytes, then fall back to a
  // literal search for the pattern text.
  static inline const size_t MAX_REGEX_INPUT = 4096;

  CompiledCriteria() = default;
  explicit CompiledCriteria(const FilterCriteria& criteria);

  bool matches(const LogRecord& record) const;
  const FilterCriteria& criteria() const { return criteria_; }
  bool is_regex() const { return pattern_ != nullptr; }

 private:
  bool text_matches(const std::string& field) const;

  FilterCriteria criteria_;
  std::string needle_;  // lowercased text, or pattern body for a regex
  std::shared_ptr<const std::regex> pattern_;
};

namespace QueryEngine {

bool matches(const LogRecord& record, const FilterCriteria& criteria);

/**
 * @brief Records of `snapshot` matching every criterion, in their original
 * order.
 */
std::vector<LogRecord> filter(const std::vector<LogRecord>& snapshot,
                              const FilterCriteria& criteria);

}  // namespace QueryEngine
