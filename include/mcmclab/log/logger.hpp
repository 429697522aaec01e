#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace mcmclab::log {

enum class Level : int { debug = 1, info = 2, warn = 3, error = 4, off = 6 };

inline std::string_view to_string(Level lv) {
  switch (lv) {
  case Level::debug:
    return "D";
  case Level::info:
    return "I";
  case Level::warn:
    return "W";
  case Level::error:
    return "E";
  default:
    return "O";
  }
}

// Accepts debug|info|warn|error|off, throws std::invalid_argument otherwise.
Level parse_level(std::string_view name);

class Logger {
public:
  static Logger &instance() {
    static Logger L;
    return L;
  }

  void set_level(Level lv) {
    level_.store(lv, std::memory_order_relaxed);
  }

  Level level() const {
    return level_.load(std::memory_order_relaxed);
  }

  template <class... Args>
  void log(Level lv, std::string_view pattern, Args &&...args) {
    log_impl(lv, pattern, std::forward<Args>(args)...);
  }

private:
  std::atomic<Level> level_{Level::info}; // default INFO
  std::mutex mu_;

  template <class... Args>
  void log_impl(Level lv, std::string_view pattern, Args &&...args) {
    if (lv < level())
      return;

    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    char tbuf[9];
    std::strftime(tbuf, sizeof(tbuf), "%H:%M:%S", &tm);

    std::string body = fmt::vformat(pattern, fmt::make_format_args(args...));
    std::string line = fmt::format("[{} {}] {}\n", tbuf, to_string(lv), body);

    std::scoped_lock lk(mu_);
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
  }
};

#define MLOG_DEBUG(...)                                                        \
  ::mcmclab::log::Logger::instance().log(::mcmclab::log::Level::debug,         \
                                         __VA_ARGS__)
#define MLOG_INFO(...)                                                         \
  ::mcmclab::log::Logger::instance().log(::mcmclab::log::Level::info,          \
                                         __VA_ARGS__)
#define MLOG_WARN(...)                                                         \
  ::mcmclab::log::Logger::instance().log(::mcmclab::log::Level::warn,          \
                                         __VA_ARGS__)
#define MLOG_ERROR(...)                                                        \
  ::mcmclab::log::Logger::instance().log(::mcmclab::log::Level::error,         \
                                         __VA_ARGS__)

} // namespace mcmclab::log
