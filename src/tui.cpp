#include "tui.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace provy::tui {

bool g_trace_enabled{ false };

namespace {

struct sink_state {
  std::mutex mutex;  // serializes every write and all state below
  std::function<void(std::string_view)> handler;
  std::optional<level> threshold;
  bool initialized{ false };
  bool active{ false };
  bool decorated{ false };
  bool trace_stderr{ false };
  std::FILE *trace_file{ nullptr };
};

sink_state &sink() {
  static sink_state state;
  return state;
}

char const *level_label(level value) {
  switch (value) {
    case level::TUI_TRACE: return "TRC";
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

// "[2026-10-19 12:00:00.123] [INF] "
std::string decoration(level severity) {
  auto const now{ std::chrono::system_clock::now() };
  auto const millis{ std::chrono::duration_cast<std::chrono::milliseconds>(
                         now.time_since_epoch())
                         .count() %
                     1000 };
  std::time_t const seconds{ std::chrono::system_clock::to_time_t(now) };
  std::tm local{};
  localtime_r(&seconds, &local);

  char stamp[32]{};
  std::strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &local);

  char out[64]{};
  std::snprintf(out,
                sizeof out,
                "[%s.%03d] [%s] ",
                stamp,
                static_cast<int>(millis),
                level_label(severity));
  return out;
}

std::string vformat(char const *fmt, va_list args) {
  va_list sizing;
  va_copy(sizing, args);
  int const needed{ std::vsnprintf(nullptr, 0, fmt, sizing) };
  va_end(sizing);
  if (needed <= 0) { return {}; }

  std::string out(static_cast<std::size_t>(needed) + 1, '\0');
  std::vsnprintf(out.data(), out.size(), fmt, args);
  out.resize(static_cast<std::size_t>(needed));
  return out;
}

void write_line_locked(sink_state &s, std::string line) {
  line.push_back('\n');
  if (s.handler) {
    s.handler(line);
  } else {
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
  }
}

void close_trace_file_locked(sink_state &s) {
  if (s.trace_file) {
    std::fclose(s.trace_file);
    s.trace_file = nullptr;
  }
  g_trace_enabled = s.trace_stderr;
}

void log(level severity, char const *fmt, va_list args) {
  auto &s{ sink() };
  if (fmt == nullptr) { return; }

  std::lock_guard<std::mutex> lock{ s.mutex };
  if (!s.active) { return; }
  if (s.threshold && severity < *s.threshold) { return; }

  std::string message{ vformat(fmt, args) };
  write_line_locked(s, s.decorated ? decoration(severity) + message : std::move(message));
}

}  // namespace

void init() {
  auto &s{ sink() };
  std::lock_guard<std::mutex> lock{ s.mutex };
  if (s.initialized) { throw std::logic_error{ "provy::tui::init called more than once" }; }
  s.initialized = true;
  g_trace_enabled = false;
}

void configure_trace_outputs(std::vector<trace_output_spec> outputs) {
  auto &s{ sink() };
  std::lock_guard<std::mutex> lock{ s.mutex };
  if (!s.initialized) {
    throw std::logic_error{ "provy::tui::configure_trace_outputs called before init" };
  }
  if (s.active) {
    throw std::logic_error{ "provy::tui::configure_trace_outputs called while active" };
  }

  s.trace_stderr = false;
  close_trace_file_locked(s);

  std::optional<std::filesystem::path> file_path;
  for (auto const &spec : outputs) {
    if (spec.type == trace_output_type::std_err) {
      s.trace_stderr = true;
    } else if (spec.file_path) {
      if (file_path) { throw std::logic_error{ "Only one trace file output supported" }; }
      file_path = spec.file_path;
    }
  }

  if (file_path) {
    s.trace_file = std::fopen(file_path->string().c_str(), "w");
    if (!s.trace_file) {
      s.trace_stderr = false;
      g_trace_enabled = false;
      throw std::runtime_error("Failed to open trace file: " + file_path->string());
    }
  }

  g_trace_enabled = s.trace_stderr || s.trace_file;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  auto &s{ sink() };
  std::lock_guard<std::mutex> lock{ s.mutex };
  if (!s.initialized) {
    throw std::logic_error{ "provy::tui::set_output_handler called before init" };
  }
  if (s.active) {
    throw std::logic_error{ "provy::tui::set_output_handler called while active" };
  }
  s.handler = std::move(handler);
}

void trace(trace_event_t event) {
  if (!g_trace_enabled) { return; }

  auto &s{ sink() };
  std::lock_guard<std::mutex> lock{ s.mutex };
  if (!s.active) { return; }

  if (s.trace_stderr) {
    std::string line{ trace_event_to_string(event) };
    write_line_locked(s, s.decorated ? decoration(level::TUI_TRACE) + line : std::move(line));
  }

  if (s.trace_file) {
    auto const json{ trace_event_to_json(event) + "\n" };
    if (std::fwrite(json.data(), 1, json.size(), s.trace_file) != json.size() ||
        std::fflush(s.trace_file) != 0) {
      close_trace_file_locked(s);
      write_line_locked(s, "trace file write failed; file tracing disabled");
    }
  }
}

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log(level::TUI_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log(level::TUI_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log(level::TUI_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  std::lock_guard<std::mutex> lock{ sink().mutex };
  va_list args;
  va_start(args, fmt);
  int const written{ std::vprintf(fmt, args) };
  va_end(args);
  if (written > 0) { std::fflush(stdout); }
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  auto &s{ sink() };
  std::lock_guard<std::mutex> lock{ s.mutex };
  if (!s.initialized) { return; }
  if (s.active) { throw std::logic_error{ "provy::tui::scope is already active" }; }

  s.threshold = threshold;
  s.decorated = decorated_logging;
  s.active = true;
  active = true;
}

scope::~scope() {
  if (!active) { return; }

  auto &s{ sink() };
  std::lock_guard<std::mutex> lock{ s.mutex };
  s.active = false;
  s.trace_stderr = false;
  close_trace_file_locked(s);
}

}  // namespace provy::tui
