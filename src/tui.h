#pragma once

#include <functional>
#include <optional>
#include <string_view>

#if defined(__clang__) || defined(__GNUC__)
#define SHIPIT_TUI_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define SHIPIT_TUI_PRINTF(idx, first)
#endif

namespace shipit::tui {

enum class level { TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

void init();
void set_output_handler(std::function<void(std::string_view)> handler);
void run(std::optional<level> threshold = std::nullopt, bool decorated_logging = false);
void shutdown();

void debug(char const *fmt, ...) SHIPIT_TUI_PRINTF(1, 2);
void info(char const *fmt, ...) SHIPIT_TUI_PRINTF(1, 2);
void warn(char const *fmt, ...) SHIPIT_TUI_PRINTF(1, 2);
void error(char const *fmt, ...) SHIPIT_TUI_PRINTF(1, 2);

// Phase announcement, logged at info level. Rendered bold cyan on ANSI terminals.
void header(char const *fmt, ...) SHIPIT_TUI_PRINTF(1, 2);

void print_stdout(char const *fmt, ...) SHIPIT_TUI_PRINTF(1, 2);

bool is_tty();

struct scope {  // raii helper
  explicit scope(std::optional<level> threshold, bool decorated_logging);
  ~scope();

 private:
  bool active{ false };
};

// Flushes pending log output and holds further output back while a child process
// owns the terminal.
class interactive_mode_guard {
 public:
  interactive_mode_guard();
  ~interactive_mode_guard();

  interactive_mode_guard(interactive_mode_guard const &) = delete;
  interactive_mode_guard &operator=(interactive_mode_guard const &) = delete;
};

}  // namespace shipit::tui

#undef SHIPIT_TUI_PRINTF
