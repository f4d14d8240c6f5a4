#pragma once

#include <functional>
#include <optional>
#include <string_view>

#if defined(__clang__) || defined(__GNUC__)
#define FORCEGEN_TUI_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define FORCEGEN_TUI_PRINTF(idx, first)
#endif

namespace forcegen::tui {

enum class level { TUI_TRACE, TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

void init();
void set_output_handler(std::function<void(std::string_view)> handler);
void run(std::optional<level> threshold = std::nullopt, bool decorated_logging = false);
void shutdown();

void trace(char const *fmt, ...) FORCEGEN_TUI_PRINTF(1, 2);
void debug(char const *fmt, ...) FORCEGEN_TUI_PRINTF(1, 2);
void info(char const *fmt, ...) FORCEGEN_TUI_PRINTF(1, 2);
void warn(char const *fmt, ...) FORCEGEN_TUI_PRINTF(1, 2);
void error(char const *fmt, ...) FORCEGEN_TUI_PRINTF(1, 2);

// Primary program output; bypasses severity filtering and decoration.
void print_stdout(char const *fmt, ...) FORCEGEN_TUI_PRINTF(1, 2);
void write_stdout(std::string_view text);

struct scope {  // raii helper
  explicit scope(std::optional<level> threshold, bool decorated_logging);
  ~scope();

 private:
  bool active{ false };
};

}  // namespace forcegen::tui

#undef FORCEGEN_TUI_PRINTF
