#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>
#include <utility>

namespace provy {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(value ? "true" : "false");
}

void append_kind(std::string &out, step_kind kind) {
  append_kv(out, "step", step_kind_name(kind));
  append_kv(out, "step_num", static_cast<std::int64_t>(static_cast<int>(kind)));
}

}  // namespace

step_trace_scope::step_trace_scope(std::int64_t step_index,
                                   step_kind step,
                                   std::string label)
    : index{ step_index }, kind{ step }, start{ std::chrono::steady_clock::now() } {
  PROVY_TRACE_STEP_START(index, kind, std::move(label));
}

step_trace_scope::~step_trace_scope() {
  if (failed) { return; }
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  PROVY_TRACE_STEP_COMPLETE(index, kind, static_cast<std::int64_t>(duration_ms));
}

void step_trace_scope::fail(bool fatal, std::string reason) {
  failed = fatal;
  PROVY_TRACE_STEP_FAILED(index, kind, fatal, std::move(reason));
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(run_start),
          TRACE_NAME(run_complete),
          TRACE_NAME(step_start),
          TRACE_NAME(step_complete),
          TRACE_NAME(step_failed),
          TRACE_NAME(command_start),
          TRACE_NAME(command_complete),
          TRACE_NAME(fetch_start),
          TRACE_NAME(fetch_complete),
          TRACE_NAME(env_updated),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::run_start const &value) {
            std::ostringstream oss;
            oss << "run_start image=" << value.image << " steps=" << value.step_count;
            return oss.str();
          },
          [](trace_events::run_complete const &value) {
            std::ostringstream oss;
            oss << "run_complete image=" << value.image
                << " success=" << bool_string(value.success)
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::step_start const &value) {
            std::ostringstream oss;
            oss << "step_start index=" << value.index
                << " step=" << step_kind_name(value.kind) << " label=" << value.label;
            return oss.str();
          },
          [](trace_events::step_complete const &value) {
            std::ostringstream oss;
            oss << "step_complete index=" << value.index
                << " step=" << step_kind_name(value.kind)
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::step_failed const &value) {
            std::ostringstream oss;
            oss << "step_failed index=" << value.index
                << " step=" << step_kind_name(value.kind)
                << " fatal=" << bool_string(value.fatal) << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::command_start const &value) {
            std::ostringstream oss;
            oss << "command_start step=" << step_kind_name(value.kind)
                << " command=" << value.command;
            return oss.str();
          },
          [](trace_events::command_complete const &value) {
            std::ostringstream oss;
            oss << "command_complete step=" << step_kind_name(value.kind)
                << " exit_code=" << value.exit_code
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::fetch_start const &value) {
            std::ostringstream oss;
            oss << "fetch_start url=" << value.url
                << " destination=" << value.destination;
            return oss.str();
          },
          [](trace_events::fetch_complete const &value) {
            std::ostringstream oss;
            oss << "fetch_complete url=" << value.url
                << " bytes_downloaded=" << value.bytes_downloaded
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::env_updated const &value) {
            std::ostringstream oss;
            oss << "env_updated name=" << value.name << " value=" << value.value;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::run_start const &value) {
            append_kv(output, "image", value.image);
            append_kv(output, "step_count", value.step_count);
          },
          [&](trace_events::run_complete const &value) {
            append_kv(output, "image", value.image);
            append_kv(output, "success", value.success);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::step_start const &value) {
            append_kv(output, "index", value.index);
            append_kind(output, value.kind);
            append_kv(output, "label", value.label);
          },
          [&](trace_events::step_complete const &value) {
            append_kv(output, "index", value.index);
            append_kind(output, value.kind);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::step_failed const &value) {
            append_kv(output, "index", value.index);
            append_kind(output, value.kind);
            append_kv(output, "fatal", value.fatal);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::command_start const &value) {
            append_kind(output, value.kind);
            append_kv(output, "command", value.command);
          },
          [&](trace_events::command_complete const &value) {
            append_kind(output, value.kind);
            append_kv(output, "exit_code", static_cast<std::int64_t>(value.exit_code));
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::fetch_start const &value) {
            append_kv(output, "url", value.url);
            append_kv(output, "destination", value.destination);
          },
          [&](trace_events::fetch_complete const &value) {
            append_kv(output, "url", value.url);
            append_kv(output, "bytes_downloaded", value.bytes_downloaded);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::env_updated const &value) {
            append_kv(output, "name", value.name);
            append_kv(output, "value", value.value);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace provy
