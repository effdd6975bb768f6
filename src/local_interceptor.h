#pragma once

#include <fmt/core.h>

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <typeinfo>

#include "log_hub.h"
#include "stream_redirect.h"

/**
 * @brief Captures the process's own log output as local records.
 *
 * install() redirects std::clog and std::cerr exactly once per process. Every
 * line written to them is still forwarded unchanged to the original stream
 * buffer, and additionally published as a record (std::clog lines are INFO,
 * std::cerr lines are ERROR, unless the line starts with a level tag such as
 * "Warning:"). The Log:: functions below publish leveled records directly.
 *
 * Records go to whichever sink is attached; with none attached they are only
 * forwarded. The sink is only ever called on the thread that attached it.
 * Records produced on other threads are queued until that thread calls
 * drain_pending().
 */
class LocalInterceptor {
 public:
  static inline const std::string DEFAULT_TARGET = "frontend";
  // oldest queued off-thread records are dropped beyond this
  static inline const size_t MAX_PENDING = 10000;

  // Detaches its sink when destroyed.
  class SinkAttachment {
   public:
    SinkAttachment() = default;
    ~SinkAttachment() { release(); }
    SinkAttachment(SinkAttachment&& other) noexcept;
    SinkAttachment& operator=(SinkAttachment&& other) noexcept;
    SinkAttachment(const SinkAttachment&) = delete;
    SinkAttachment& operator=(const SinkAttachment&) = delete;

    void release();

   private:
    friend class LocalInterceptor;
    SinkAttachment(LocalInterceptor* owner, uint64_t generation)
        : owner_(owner), generation_(generation) {}

    LocalInterceptor* owner_ = nullptr;
    uint64_t generation_ = 0;
  };

  /**
   * @brief Installs the interceptor on first call; later calls return the
   * same instance and change nothing.
   */
  static LocalInterceptor& install();

  /**
   * @return the installed interceptor, or nullptr before install().
   */
  static LocalInterceptor* instance() { return instance_.load(); }

  /**
   * @brief Routes captured records to `sink`, replacing any previous sink.
   * The calling thread becomes the one that publishes to it.
   */
  [[nodiscard]] SinkAttachment attach(RecordSink& sink);

  /**
   * @brief Publishes records queued by other threads. Call it from the
   * thread that attached the sink, once per frame.
   */
  void drain_pending();

  size_t pending_count() const;

  /**
   * @brief Forwards `message` to the original stream and publishes it.
   */
  void capture(LogLevel level, const std::string& target,
               const std::string& message);

  LocalInterceptor(const LocalInterceptor&) = delete;
  LocalInterceptor& operator=(const LocalInterceptor&) = delete;

 private:
  LocalInterceptor();
  ~LocalInterceptor();

  void on_stream_line(LogLevel stream_level, const std::string& line);
  void publish(LogRecord record);
  void detach(uint64_t generation);

  static std::atomic<LocalInterceptor*> instance_;

  std::recursive_mutex sink_mutex_;
  RecordSink* sink_ = nullptr;
  uint64_t generation_ = 0;
  std::thread::id sink_thread_;

  mutable std::mutex pending_mutex_;
  std::deque<LogRecord> pending_;

  LogStreamBuffer clog_buffer_;
  LogStreamBuffer cerr_buffer_;
  StreamRedirector redirect_clog_;
  StreamRedirector redirect_cerr_;
};

/**
 * @return the level named by a leading "Error:", "Fatal:", "Warning:",
 * "Warn:", "Info:", "Debug:" or "Trace:" tag, or `fallback`.
 */
LogLevel detect_level_tag(std::string_view line, LogLevel fallback);

namespace Log {

namespace detail {

template <typename T, typename = void>
struct is_ostreamable : std::false_type {};
template <typename T>
struct is_ostreamable<T, std::void_t<decltype(std::declval<std::ostream&>()
                                              << std::declval<const T&>())>>
    : std::true_type {};

// raw string coercion, the last resort for any argument
template <typename T>
std::string coerce(const T& value) {
  try {
    if constexpr (fmt::is_formattable<T>::value) {
      return fmt::format("{}", value);
    } else if constexpr (is_ostreamable<T>::value) {
      std::ostringstream out;
      out << value;
      return out.str();
    } else {
      return fmt::format("[{}]", typeid(T).name());
    }
  } catch (const std::exception&) {
    return "[unprintable]";
  }
}

template <typename T>
std::string to_text(const T& value) {
  using Decayed = std::decay_t<T>;
  if constexpr (std::is_same_v<Decayed, const char*> ||
                std::is_same_v<Decayed, char*>) {
    return value != nullptr ? std::string(value) : std::string("null");
  } else if constexpr (std::is_same_v<Decayed, nlohmann::json>) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
    return std::string(std::string_view(value));
  } else if constexpr (std::is_arithmetic_v<T>) {
    return coerce(value);
  } else if constexpr (std::is_constructible_v<nlohmann::json, const T&>) {
    try {
      return nlohmann::json(value).dump();
    } catch (const nlohmann::json::exception&) {
      // invalid UTF-8 in a nested string
      try {
        return nlohmann::json(value).dump(
            -1, ' ', false, nlohmann::json::error_handler_t::replace);
      } catch (const std::exception&) {
        return coerce(value);
      }
    } catch (const std::exception&) {
      return coerce(value);
    }
  } else {
    return coerce(value);
  }
}

template <typename... Args>
std::string join(const Args&... args) {
  std::string message;
  ((message += (message.empty() ? "" : " "), message += to_text(args)), ...);
  return message;
}

void emit(LogLevel level, const std::string& target, const std::string& message);

}  // namespace detail

template <typename... Args>
void info(const Args&... args) {
  detail::emit(LogLevel::Info, LocalInterceptor::DEFAULT_TARGET,
               detail::join(args...));
}

// alias of info()
template <typename... Args>
void log(const Args&... args) {
  detail::emit(LogLevel::Info, LocalInterceptor::DEFAULT_TARGET,
               detail::join(args...));
}

template <typename... Args>
void warn(const Args&... args) {
  detail::emit(LogLevel::Warn, LocalInterceptor::DEFAULT_TARGET,
               detail::join(args...));
}

template <typename... Args>
void error(const Args&... args) {
  detail::emit(LogLevel::Error, LocalInterceptor::DEFAULT_TARGET,
               detail::join(args...));
}

template <typename... Args>
void debug(const Args&... args) {
  detail::emit(LogLevel::Debug, LocalInterceptor::DEFAULT_TARGET,
               detail::join(args...));
}

// Same functions with a caller-chosen target.
class Scope {
 public:
  explicit Scope(std::string target) : target_(std::move(target)) {}

  template <typename... Args>
  void info(const Args&... args) const {
    detail::emit(LogLevel::Info, target_, detail::join(args...));
  }
  template <typename... Args>
  void log(const Args&... args) const {
    detail::emit(LogLevel::Info, target_, detail::join(args...));
  }
  template <typename... Args>
  void warn(const Args&... args) const {
    detail::emit(LogLevel::Warn, target_, detail::join(args...));
  }
  template <typename... Args>
  void error(const Args&... args) const {
    detail::emit(LogLevel::Error, target_, detail::join(args...));
  }
  template <typename... Args>
  void debug(const Args&... args) const {
    detail::emit(LogLevel::Debug, target_, detail::join(args...));
  }

  const std::string& target() const { return target_; }

 private:
  std::string target_;
};

}  // namespace Log
