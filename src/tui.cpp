#include "tui.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <unistd.h>

namespace {

using shipit::tui::level;

constexpr std::chrono::milliseconds kDrainInterval{ 33 };

constexpr char kHeaderStyle[]{ "\x1b[1;36m" };
constexpr char kResetStyle[]{ "\x1b[0m" };

struct log_record {
  std::chrono::system_clock::time_point when;
  level severity;
  std::string text;
  bool header{ false };
};

using log_batch = std::deque<log_record>;

struct log_state {
  std::mutex mutex;  // guards queue, paused, handler, threshold, decorated
  std::condition_variable wake;
  log_batch queue;
  std::function<void(std::string_view)> handler;
  std::optional<level> threshold;
  bool decorated{ false };
  bool paused{ false };
  bool initialized{ false };
  std::atomic_bool stopping{ false };
  std::thread worker;

  std::mutex stdout_mutex;
  std::mutex terminal_mutex;  // held while a child process owns the terminal
};

log_state s_log;

char const *severity_label(level value) {
  switch (value) {
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

bool stderr_supports_ansi() {
  if (!shipit::tui::is_tty()) { return false; }
  char const *const term{ std::getenv("TERM") };
  return term && std::strcmp(term, "dumb") != 0;
}

// "[2026-01-31 12:00:00.123] [INF] "
std::string decoration(log_record const &rec) {
  auto const secs{ std::chrono::floor<std::chrono::seconds>(rec.when) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(rec.when - secs).count()
  };

  std::time_t const t{ std::chrono::system_clock::to_time_t(secs) };
  std::tm local{};
  localtime_r(&t, &local);

  char stamp[32]{};
  if (std::strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &local) == 0) { return {}; }

  char out[64]{};
  int const n{ std::snprintf(out,
                             sizeof out,
                             "[%s.%03d] [%-3s] ",
                             stamp,
                             static_cast<int>(millis),
                             severity_label(rec.severity)) };
  return n > 0 ? std::string(out, static_cast<size_t>(n)) : std::string{};
}

void emit(log_batch &batch,
          std::function<void(std::string_view)> const &handler,
          bool decorated) {
  if (batch.empty()) { return; }
  bool const ansi{ !handler && stderr_supports_ansi() };

  for (auto const &rec : batch) {
    std::string line{ decorated ? decoration(rec) : std::string{} };
    if (rec.header && ansi) {
      line.append(kHeaderStyle).append(rec.text).append(kResetStyle);
    } else {
      line.append(rec.text);
    }
    line.push_back('\n');

    if (handler) {
      handler(line);
    } else {
      std::fwrite(line.data(), 1, line.size(), stderr);
    }
  }
  batch.clear();

  if (!handler) { std::fflush(stderr); }
}

void drain_loop() {
  std::unique_lock lock{ s_log.mutex };

  for (;;) {
    s_log.wake.wait_for(lock, kDrainInterval, [] { return s_log.stopping.load(); });
    bool const stopping{ s_log.stopping.load() };

    log_batch batch;
    if (!s_log.paused || stopping) { batch.swap(s_log.queue); }
    auto const handler{ s_log.handler };
    bool const decorated{ s_log.decorated };

    lock.unlock();
    try {
      emit(batch, handler, decorated);
    } catch (std::exception const &e) {
      std::fprintf(stderr, "[log output failed: %s]\n", e.what());
      std::fflush(stderr);
    }
    lock.lock();

    if (stopping) { return; }
  }
}

std::optional<std::string> vformat(char const *fmt, va_list args) {
  va_list sizing;
  va_copy(sizing, args);
  int const needed{ std::vsnprintf(nullptr, 0, fmt, sizing) };
  va_end(sizing);
  if (needed <= 0) { return std::nullopt; }

  std::string text(static_cast<size_t>(needed) + 1, '\0');
  if (std::vsnprintf(text.data(), text.size(), fmt, args) < 0) { return std::nullopt; }
  text.resize(static_cast<size_t>(needed));
  return text;
}

void enqueue(level severity, bool header, char const *fmt, va_list args) {
  if (fmt == nullptr) { return; }

  {
    std::lock_guard lock{ s_log.mutex };
    if (!s_log.initialized) { return; }
    if (s_log.threshold && severity < *s_log.threshold) { return; }
  }

  auto text{ vformat(fmt, args) };
  if (!text) { return; }

  {
    std::lock_guard lock{ s_log.mutex };
    s_log.queue.push_back(log_record{ .when = std::chrono::system_clock::now(),
                                      .severity = severity,
                                      .text = std::move(*text),
                                      .header = header });
  }
  s_log.wake.notify_one();
}

}  // namespace

namespace shipit::tui {

void init() {
  std::lock_guard lock{ s_log.mutex };
  if (s_log.initialized) { throw std::logic_error{ "shipit::tui::init called twice" }; }
  s_log.threshold.reset();
  s_log.decorated = false;
  s_log.initialized = true;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  std::lock_guard lock{ s_log.mutex };
  if (!s_log.initialized) {
    throw std::logic_error{ "shipit::tui::set_output_handler called before init" };
  }
  if (s_log.worker.joinable()) {
    throw std::logic_error{ "shipit::tui::set_output_handler called while running" };
  }
  s_log.handler = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  std::lock_guard lock{ s_log.mutex };
  if (!s_log.initialized) { throw std::logic_error{ "shipit::tui::run called before init" }; }
  if (s_log.worker.joinable()) {
    throw std::logic_error{ "shipit::tui::run called while already running" };
  }

  s_log.threshold = threshold;
  s_log.decorated = decorated_logging;
  s_log.stopping = false;
  s_log.worker = std::thread{ drain_loop };
}

void shutdown() {
  std::thread worker;
  {
    std::lock_guard lock{ s_log.mutex };
    if (!s_log.worker.joinable()) {
      throw std::logic_error{ "shipit::tui::shutdown called while not running" };
    }
    worker = std::move(s_log.worker);
    s_log.stopping = true;
  }

  s_log.wake.notify_all();
  worker.join();
  s_log.stopping = false;
}

bool is_tty() { return ::isatty(STDERR_FILENO) != 0; }

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  enqueue(level::TUI_DEBUG, false, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  enqueue(level::TUI_INFO, false, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  enqueue(level::TUI_WARN, false, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  enqueue(level::TUI_ERROR, false, fmt, args);
  va_end(args);
}

void header(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  enqueue(level::TUI_INFO, true, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  std::lock_guard lock{ s_log.stdout_mutex };

  va_list args;
  va_start(args, fmt);
  int const written{ std::vprintf(fmt, args) };
  va_end(args);

  if (written > 0) { std::fflush(stdout); }
}

interactive_mode_guard::interactive_mode_guard() {
  std::unique_lock terminal{ s_log.terminal_mutex };

  log_batch batch;
  std::function<void(std::string_view)> handler;
  bool decorated{ false };
  {
    std::lock_guard lock{ s_log.mutex };
    s_log.paused = true;
    batch.swap(s_log.queue);
    handler = s_log.handler;
    decorated = s_log.decorated;
  }

  try {
    emit(batch, handler, decorated);
  } catch (...) {
    std::lock_guard lock{ s_log.mutex };
    s_log.paused = false;
    throw;  // terminal unlocks with the unique_lock
  }

  terminal.release();  // the destructor unlocks
}

interactive_mode_guard::~interactive_mode_guard() {
  {
    std::lock_guard lock{ s_log.mutex };
    s_log.paused = false;
  }
  s_log.wake.notify_one();
  s_log.terminal_mutex.unlock();
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  {
    std::lock_guard lock{ s_log.mutex };
    if (!s_log.initialized) { return; }
  }
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace shipit::tui
