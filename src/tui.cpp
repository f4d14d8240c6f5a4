#include "tui.h"

#include <array>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>
#include <utility>

using forcegen::tui::level;

namespace {

// Driven from the main thread only.
struct logger_state {
  std::function<void(std::string_view)> handler;
  std::optional<level> threshold;
  bool decorated{ false };
  bool initialized{ false };
  bool running{ false };
};

logger_state s_log{};

constexpr std::array<std::string_view, 5> kLevelLabels{ "TRC", "DBG", "INF", "WRN", "ERR" };

std::string vformat(char const *fmt, va_list args) {
  va_list sizing;
  va_copy(sizing, args);
  int const needed{ std::vsnprintf(nullptr, 0, fmt, sizing) };
  va_end(sizing);
  if (needed < 0) { return {}; }

  std::string text(static_cast<std::size_t>(needed) + 1, '\0');
  std::vsnprintf(text.data(), text.size(), fmt, args);
  text.resize(static_cast<std::size_t>(needed));
  return text;
}

// "[2024-01-31 12:34:56.789] [INF] "
std::string decoration(level severity) {
  auto const now{ std::chrono::system_clock::now() };
  auto const millis{ std::chrono::duration_cast<std::chrono::milliseconds>(
                         now.time_since_epoch())
                         .count() %
                     1000 };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(now) };
  std::tm local_tm{};
  localtime_r(&timestamp, &local_tm);

  std::array<char, 32> stamp{};
  if (std::strftime(stamp.data(), stamp.size(), "%Y-%m-%d %H:%M:%S", &local_tm) == 0) {
    return {};
  }

  std::array<char, 64> prefix{};
  std::snprintf(prefix.data(),
                prefix.size(),
                "[%s.%03lld] [%s] ",
                stamp.data(),
                static_cast<long long>(millis),
                kLevelLabels[static_cast<std::size_t>(severity)].data());
  return prefix.data();
}

void log_line(level severity, char const *fmt, va_list args) {
  if (!s_log.initialized || !fmt) { return; }
  if (s_log.threshold && severity < *s_log.threshold) { return; }

  std::string line{ s_log.decorated ? decoration(severity) : std::string{} };
  line.append(vformat(fmt, args));
  line.push_back('\n');

  if (s_log.handler) {
    s_log.handler(line);
    return;
  }
  std::fwrite(line.data(), 1, line.size(), stderr);
  std::fflush(stderr);
}

}  // namespace

#define FORCEGEN_TUI_LOG_FN(name, severity) \
  void name(char const *fmt, ...) {         \
    va_list args;                           \
    va_start(args, fmt);                    \
    log_line(severity, fmt, args);          \
    va_end(args);                           \
  }

namespace forcegen::tui {

void init() {
  if (s_log.initialized) {
    throw std::logic_error{ "forcegen::tui::init called more than once" };
  }

  s_log.threshold = std::nullopt;
  s_log.decorated = false;
  s_log.initialized = true;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  if (!s_log.initialized) {
    throw std::logic_error{ "forcegen::tui::set_output_handler called before init" };
  }

  if (s_log.running) {
    throw std::logic_error{ "forcegen::tui::set_output_handler called while running" };
  }

  s_log.handler = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  if (!s_log.initialized) {
    throw std::logic_error{ "forcegen::tui::run called before init" };
  }

  if (s_log.running) {
    throw std::logic_error{ "forcegen::tui::run called while already running" };
  }

  s_log.threshold = std::move(threshold);
  s_log.decorated = decorated_logging;
  s_log.running = true;
}

void shutdown() {
  if (!s_log.running) {
    throw std::logic_error{ "forcegen::tui::shutdown called while not running" };
  }

  s_log.running = false;
  std::fflush(stderr);
}

FORCEGEN_TUI_LOG_FN(trace, level::TUI_TRACE)
FORCEGEN_TUI_LOG_FN(debug, level::TUI_DEBUG)
FORCEGEN_TUI_LOG_FN(info, level::TUI_INFO)
FORCEGEN_TUI_LOG_FN(warn, level::TUI_WARN)
FORCEGEN_TUI_LOG_FN(error, level::TUI_ERROR)

#undef FORCEGEN_TUI_LOG_FN

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  va_list args;
  va_start(args, fmt);
  std::string const text{ vformat(fmt, args) };
  va_end(args);

  write_stdout(text);
}

void write_stdout(std::string_view text) {
  if (text.empty()) { return; }
  if (std::fwrite(text.data(), 1, text.size(), stdout) != text.size()) {
    throw std::runtime_error("failed to write to stdout");
  }
  std::fflush(stdout);
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s_log.initialized) { return; }
  run(std::move(threshold), decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace forcegen::tui
