#pragma once

#include "trace.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#if defined(__clang__) || defined(__GNUC__)
#define PROVY_TUI_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define PROVY_TUI_PRINTF(idx, first)
#endif

namespace provy::tui {

enum class level { TUI_TRACE, TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

enum class trace_output_type { std_err, file };

struct trace_output_spec {
  trace_output_type type;
  std::optional<std::filesystem::path> file_path;
};

void init();
void configure_trace_outputs(std::vector<trace_output_spec> outputs);

// Replaces stderr as the destination of log lines and stderr traces.
void set_output_handler(std::function<void(std::string_view)> handler);

extern bool g_trace_enabled;

void trace(trace_event_t event);
void debug(char const *fmt, ...) PROVY_TUI_PRINTF(1, 2);
void info(char const *fmt, ...) PROVY_TUI_PRINTF(1, 2);
void warn(char const *fmt, ...) PROVY_TUI_PRINTF(1, 2);
void error(char const *fmt, ...) PROVY_TUI_PRINTF(1, 2);

void print_stdout(char const *fmt, ...) PROVY_TUI_PRINTF(1, 2);

// Log lines and traces are written only while a scope is alive. Closing the scope
// closes the trace file and disables tracing.
struct scope {
  explicit scope(std::optional<level> threshold, bool decorated_logging = false);
  ~scope();

  scope(scope const &) = delete;
  scope &operator=(scope const &) = delete;

 private:
  bool active{ false };
};

}  // namespace provy::tui

#undef PROVY_TUI_PRINTF
