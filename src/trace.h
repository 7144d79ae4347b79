#pragma once

#include "step_kind.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace provy {

namespace trace_events {

struct run_start {
  std::string image;
  std::int64_t step_count;
};

struct run_complete {
  std::string image;
  bool success;
  std::int64_t duration_ms;
};

struct step_start {
  std::int64_t index;
  step_kind kind;
  std::string label;
};

struct step_complete {
  std::int64_t index;
  step_kind kind;
  std::int64_t duration_ms;
};

struct step_failed {
  std::int64_t index;
  step_kind kind;
  bool fatal;
  std::string reason;
};

struct command_start {
  step_kind kind;
  std::string command;
};

struct command_complete {
  step_kind kind;
  int exit_code;
  std::int64_t duration_ms;
};

struct fetch_start {
  std::string url;
  std::string destination;
};

struct fetch_complete {
  std::string url;
  std::int64_t bytes_downloaded;
  std::int64_t duration_ms;
};

struct env_updated {
  std::string name;
  std::string value;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::run_start,
                                   trace_events::run_complete,
                                   trace_events::step_start,
                                   trace_events::step_complete,
                                   trace_events::step_failed,
                                   trace_events::command_start,
                                   trace_events::command_complete,
                                   trace_events::fetch_start,
                                   trace_events::fetch_complete,
                                   trace_events::env_updated>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);
}  // namespace tui

// Emits step_start on construction and step_complete on destruction unless marked
// failed first.
struct step_trace_scope {
  std::int64_t index;
  step_kind kind;
  std::chrono::steady_clock::time_point start;
  bool failed{ false };

  step_trace_scope(std::int64_t step_index, step_kind step, std::string label);
  ~step_trace_scope();

  void fail(bool fatal, std::string reason);
};

}  // namespace provy

#define PROVY_TRACE_UNLIKELY [[unlikely]]

#define PROVY_TRACE_EMIT(event_expr) \
  do { \
    if (::provy::tui::g_trace_enabled) PROVY_TRACE_UNLIKELY { \
        ::provy::tui::trace event_expr; \
      } \
  } while (0)

#define PROVY_TRACE_RUN_START(image_value, count_value) \
  PROVY_TRACE_EMIT((::provy::trace_events::run_start{ \
      .image = (image_value), \
      .step_count = static_cast<std::int64_t>(count_value), \
  }))

#define PROVY_TRACE_RUN_COMPLETE(image_value, success_value, duration_value) \
  PROVY_TRACE_EMIT((::provy::trace_events::run_complete{ \
      .image = (image_value), \
      .success = (success_value), \
      .duration_ms = (duration_value), \
  }))

#define PROVY_TRACE_STEP_START(index_value, kind_value, label_value) \
  PROVY_TRACE_EMIT((::provy::trace_events::step_start{ \
      .index = (index_value), \
      .kind = (kind_value), \
      .label = (label_value), \
  }))

#define PROVY_TRACE_STEP_COMPLETE(index_value, kind_value, duration_value) \
  PROVY_TRACE_EMIT((::provy::trace_events::step_complete{ \
      .index = (index_value), \
      .kind = (kind_value), \
      .duration_ms = (duration_value), \
  }))

#define PROVY_TRACE_STEP_FAILED(index_value, kind_value, fatal_value, reason_value) \
  PROVY_TRACE_EMIT((::provy::trace_events::step_failed{ \
      .index = (index_value), \
      .kind = (kind_value), \
      .fatal = (fatal_value), \
      .reason = (reason_value), \
  }))

#define PROVY_TRACE_COMMAND_START(kind_value, command_value) \
  PROVY_TRACE_EMIT((::provy::trace_events::command_start{ \
      .kind = (kind_value), \
      .command = (command_value), \
  }))

#define PROVY_TRACE_COMMAND_COMPLETE(kind_value, exit_code_value, duration_value) \
  PROVY_TRACE_EMIT((::provy::trace_events::command_complete{ \
      .kind = (kind_value), \
      .exit_code = (exit_code_value), \
      .duration_ms = (duration_value), \
  }))

#define PROVY_TRACE_FETCH_START(url_value, destination_value) \
  PROVY_TRACE_EMIT((::provy::trace_events::fetch_start{ \
      .url = (url_value), \
      .destination = (destination_value), \
  }))

#define PROVY_TRACE_FETCH_COMPLETE(url_value, bytes_value, duration_value) \
  PROVY_TRACE_EMIT((::provy::trace_events::fetch_complete{ \
      .url = (url_value), \
      .bytes_downloaded = (bytes_value), \
      .duration_ms = (duration_value), \
  }))

#define PROVY_TRACE_ENV_UPDATED(name_value, value_value) \
  PROVY_TRACE_EMIT((::provy::trace_events::env_updated{ \
      .name = (name_value), \
      .value = (value_value), \
  }))
