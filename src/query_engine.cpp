#include "query_engine.h"

#include <algorithm>
#include <cctype>

namespace {

std::string to_lower(const std::string& text) {
  std::string result = text;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

bool contains_icase(const std::string& haystack, const std::string& needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(),
                        needle.end(), [](unsigned char a, unsigned char b) {
                          return std::tolower(a) == b;
                        });
  return it != haystack.end();
}

}  // namespace

CompiledCriteria::CompiledCriteria(const FilterCriteria& criteria)
    : criteria_(criteria), needle_(to_lower(criteria.text)) {
  const std::string& text = criteria_.text;
  if (text.size() > 2 && text.front() == '/' && text.back() == '/') {
    std::string body = text.substr(1, text.size() - 2);
    try {
      pattern_ = std::make_shared<const std::regex>(
          body, std::regex::ECMAScript | std::regex::icase);
      needle_ = to_lower(body);
    } catch (const std::regex_error&) {
      // invalid pattern: match the literal text instead
      pattern_.reset();
    }
  }
}

bool CompiledCriteria::text_matches(const std::string& field) const {
  if (pattern_) {
    if (field.size() <= MAX_REGEX_INPUT) {
      return std::regex_search(field, *pattern_);
    }
    auto head_end =
        field.begin() + static_cast<std::ptrdiff_t>(MAX_REGEX_INPUT);
    if (std::regex_search(field.begin(), head_end, *pattern_)) {
      return true;
    }
  }
  return contains_icase(field, needle_);
}

bool CompiledCriteria::matches(const LogRecord& record) const {
  if (criteria_.source == SourceFilter::Local &&
      record.source != LogSource::Local) {
    return false;
  }
  if (criteria_.source == SourceFilter::Remote &&
      record.source != LogSource::Remote) {
    return false;
  }
  if (criteria_.level && record.level != *criteria_.level) {
    return false;
  }
  if (criteria_.text.empty()) {
    return true;
  }
  return text_matches(record.message) || text_matches(record.target);
}

bool QueryEngine::matches(const LogRecord& record,
                          const FilterCriteria& criteria) {
  return CompiledCriteria(criteria).matches(record);
}

std::vector<LogRecord> QueryEngine::filter(
    const std::vector<LogRecord>& snapshot, const FilterCriteria& criteria) {
  CompiledCriteria compiled(criteria);
  std::vector<LogRecord> result;
  for (const auto& record : snapshot) {
    if (compiled.matches(record)) {
      result.push_back(record);
    }
  }
  return result;
}
