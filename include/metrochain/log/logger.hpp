#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fmt/format.h>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace metrochain::log {

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

// Accepts the lowercase level names; anything else yields nullopt.
inline std::optional<Level> parse_level(std::string_view name) {
  if (name == "debug")
    return Level::debug;
  if (name == "info")
    return Level::info;
  if (name == "warn")
    return Level::warn;
  if (name == "error")
    return Level::error;
  if (name == "off")
    return Level::off;
  return std::nullopt;
}

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

  bool enabled(Level lv) const { return lv >= level(); }

  // Redirects output, mainly for tests. nullptr restores stderr.
  void set_stream(std::FILE *out) {
    std::scoped_lock lk(mu_);
    out_ = out ? out : stderr;
  }

  template <class... Args>
  void log(Level lv, fmt::format_string<Args...> format, Args &&...args) {
    if (!enabled(lv))
      return;
    write(lv, fmt::format(format, std::forward<Args>(args)...));
  }

private:
  std::atomic<Level> level_{Level::info}; // default INFO
  std::mutex mu_;
  std::FILE *out_{stderr};

  void write(Level lv, const std::string &body) {
    // timestamp (HH:MM:SS)
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

    std::string line = fmt::format("[{} {}] {}\n", tbuf, to_string(lv), body);

    std::scoped_lock lk(mu_);
    std::fwrite(line.data(), 1, line.size(), out_);
    std::fflush(out_);
  }
};

// convenience macros
#define MCLOG_DEBUG(...)                                                       \
  ::metrochain::log::Logger::instance().log(::metrochain::log::Level::debug,   \
                                            __VA_ARGS__)
#define MCLOG_INFO(...)                                                        \
  ::metrochain::log::Logger::instance().log(::metrochain::log::Level::info,    \
                                            __VA_ARGS__)
#define MCLOG_WARN(...)                                                        \
  ::metrochain::log::Logger::instance().log(::metrochain::log::Level::warn,    \
                                            __VA_ARGS__)
#define MCLOG_ERROR(...)                                                       \
  ::metrochain::log::Logger::instance().log(::metrochain::log::Level::error,   \
                                            __VA_ARGS__)

} // namespace metrochain::log
