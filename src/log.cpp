// ============================================================================
// log.cpp — implementation for log.hpp
// ============================================================================
#include "meshwx/log.hpp"
#include "meshwx/clock.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace meshwx {

// ---------- helpers ----------

// Quote values that would otherwise break `key=value` tokenizing.
static std::string quote_if_needed(const std::string& v) {
  bool plain = !v.empty();
  for (char c : v) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '"' || c == '=') { plain = false; break; }
  }
  if (plain) return v;

  std::string out = "\"";
  for (char c : v) {
    if      (c == '\n') out += "\\n";
    else if (c == '"')  out += "\\\"";
    else                out += c;
  }
  out += '"';
  return out;
}

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "info";
}

bool parse_log_level(const std::string& text, LogLevel& out) {
  if (text == "debug") { out = LogLevel::Debug; return true; }
  if (text == "info")  { out = LogLevel::Info;  return true; }
  if (text == "warn" || text == "warning") { out = LogLevel::Warn; return true; }
  if (text == "error") { out = LogLevel::Error; return true; }
  return false;
}

std::string trace_json(const TraceRecord& rec, uint64_t ts_ms) {
  json j;
  j["ts"]         = ts_ms;
  j["event"]      = rec.event;
  j["message_id"] = rec.message_id;
  j["node"]       = rec.node;
  j["sent_at"]    = rec.sent_at_ms;
  if (rec.acked_at_ms) j["acked_at"] = *rec.acked_at_ms;
  else                 j["acked_at"] = nullptr;
  j["outcome"]    = rec.outcome;
  if (!rec.detail.empty()) j["detail"] = rec.detail;
  return j.dump();
}

// ---------- Logger ----------

Logger::Logger(LogLevel min_level)
: min_level_(min_level) {}

void Logger::add_sink(std::ostream& out) {
  std::lock_guard<std::mutex> lock(mu_);
  sinks_.push_back(&out);
}

void Logger::set_trace_sink(std::ostream* out) {
  std::lock_guard<std::mutex> lock(mu_);
  trace_sink_ = out;
}

void Logger::set_level(LogLevel level) {
  std::lock_guard<std::mutex> lock(mu_);
  min_level_ = level;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lock(mu_);
  return min_level_;
}

void Logger::log(LogLevel level, const std::string& event, std::initializer_list<LogField> fields) {
  // Build the line before taking the lock; formatting is the slow part.
  std::string line = format_utc_iso(now_ms_system());
  line += " level=";
  line += to_string(level);
  line += " event=";
  line += event;
  for (const auto& f : fields) {
    line += ' ';
    line += f.key;
    line += '=';
    line += quote_if_needed(f.value);
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(min_level_)) return;
  write_line_locked(line);
}

void Logger::trace(const TraceRecord& rec) {
  const std::string line = trace_json(rec, now_ms_system());

  std::lock_guard<std::mutex> lock(mu_);
  if (trace_sink_) {
    *trace_sink_ << line << '\n';
    trace_sink_->flush();
    return;
  }
  if (min_level_ != LogLevel::Debug) return;
  write_line_locked(format_utc_iso(now_ms_system()) + " level=debug event=trace " + line);
}

void Logger::write_line_locked(const std::string& line) {
  for (std::ostream* s : sinks_) {
    *s << line << '\n';
    s->flush();
  }
}

} // namespace meshwx
