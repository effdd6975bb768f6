#include "local_interceptor.h"

#include <algorithm>
#include <cctype>
#include <iostream>

std::atomic<LocalInterceptor*> LocalInterceptor::instance_{nullptr};

namespace {

struct LevelTag {
  std::string_view name;
  LogLevel level;
};

constexpr LevelTag LEVEL_TAGS[] = {
    {"error:", LogLevel::Error},   {"fatal:", LogLevel::Error},
    {"warning:", LogLevel::Warn},  {"warn:", LogLevel::Warn},
    {"info:", LogLevel::Info},     {"debug:", LogLevel::Debug},
    {"trace:", LogLevel::Trace},
};

bool starts_with_icase(std::string_view text, std::string_view prefix) {
  if (text.size() < prefix.size()) {
    return false;
  }
  return std::equal(prefix.begin(), prefix.end(), text.begin(),
                    [](char a, char b) {
                      return std::tolower(static_cast<unsigned char>(a)) ==
                             std::tolower(static_cast<unsigned char>(b));
                    });
}

bool is_blank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  });
}

}  // namespace

LogLevel detect_level_tag(std::string_view line, LogLevel fallback) {
  size_t first = line.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return fallback;
  }
  line.remove_prefix(first);
  for (const auto& tag : LEVEL_TAGS) {
    if (starts_with_icase(line, tag.name)) {
      return tag.level;
    }
  }
  return fallback;
}

LocalInterceptor::SinkAttachment::SinkAttachment(
    SinkAttachment&& other) noexcept
    : owner_(other.owner_), generation_(other.generation_) {
  other.owner_ = nullptr;
}

LocalInterceptor::SinkAttachment& LocalInterceptor::SinkAttachment::operator=(
    SinkAttachment&& other) noexcept {
  if (this != &other) {
    release();
    owner_ = other.owner_;
    generation_ = other.generation_;
    other.owner_ = nullptr;
  }
  return *this;
}

void LocalInterceptor::SinkAttachment::release() {
  if (owner_ != nullptr) {
    owner_->detach(generation_);
    owner_ = nullptr;
  }
}

LocalInterceptor::LocalInterceptor()
    : clog_buffer_(std::clog,
                   [this](const std::string& line) {
                     on_stream_line(LogLevel::Info, line);
                   }),
      cerr_buffer_(std::cerr,
                   [this](const std::string& line) {
                     on_stream_line(LogLevel::Error, line);
                   }),
      redirect_clog_(std::clog, &clog_buffer_),
      redirect_cerr_(std::cerr, &cerr_buffer_) {}

LocalInterceptor::~LocalInterceptor() { instance_.store(nullptr); }

LocalInterceptor& LocalInterceptor::install() {
  static LocalInterceptor interceptor;
  instance_.store(&interceptor);
  return interceptor;
}

LocalInterceptor::SinkAttachment LocalInterceptor::attach(RecordSink& sink) {
  std::lock_guard<std::recursive_mutex> lock(sink_mutex_);
  sink_ = &sink;
  sink_thread_ = std::this_thread::get_id();
  return SinkAttachment(this, ++generation_);
}

void LocalInterceptor::detach(uint64_t generation) {
  std::lock_guard<std::recursive_mutex> lock(sink_mutex_);
  // a newer attach() already replaced the sink
  if (generation == generation_) {
    sink_ = nullptr;
    std::lock_guard<std::mutex> pending_lock(pending_mutex_);
    pending_.clear();
  }
}

void LocalInterceptor::drain_pending() {
  std::lock_guard<std::recursive_mutex> lock(sink_mutex_);
  if (sink_ == nullptr || std::this_thread::get_id() != sink_thread_) {
    return;
  }
  std::deque<LogRecord> records;
  {
    std::lock_guard<std::mutex> pending_lock(pending_mutex_);
    records.swap(pending_);
  }
  for (const auto& record : records) {
    sink_->publish(record);
  }
}

size_t LocalInterceptor::pending_count() const {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  return pending_.size();
}

void LocalInterceptor::capture(LogLevel level, const std::string& target,
                               const std::string& message) {
  std::streambuf* original = (level == LogLevel::Error || level == LogLevel::Warn)
                                 ? cerr_buffer_.original()
                                 : clog_buffer_.original();
  if (original != nullptr) {
    std::string line = message + "\n";
    original->sputn(line.data(), static_cast<std::streamsize>(line.size()));
    original->pubsync();
  }
  publish(make_record(level, target, message, LogSource::Local));
}

void LocalInterceptor::on_stream_line(LogLevel stream_level,
                                      const std::string& line) {
  if (is_blank(line)) {
    return;
  }
  publish(make_record(detect_level_tag(line, stream_level), DEFAULT_TARGET,
                      line, LogSource::Local));
}

void LocalInterceptor::publish(LogRecord record) {
  std::lock_guard<std::recursive_mutex> lock(sink_mutex_);
  if (sink_ == nullptr) {
    return;
  }
  if (std::this_thread::get_id() == sink_thread_) {
    sink_->publish(record);
    return;
  }
  std::lock_guard<std::mutex> pending_lock(pending_mutex_);
  pending_.push_back(std::move(record));
  if (pending_.size() > MAX_PENDING) {
    pending_.pop_front();
  }
}

void Log::detail::emit(LogLevel level, const std::string& target,
                       const std::string& message) {
  LocalInterceptor* interceptor = LocalInterceptor::instance();
  if (interceptor != nullptr) {
    interceptor->capture(level, target, message);
    return;
  }
  std::ostream& stream =
      (level == LogLevel::Error || level == LogLevel::Warn) ? std::cerr
                                                            : std::clog;
  stream << message << std::endl;
}
