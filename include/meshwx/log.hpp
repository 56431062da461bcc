/**
 * @file log.hpp
 * @brief Levelled key=value logging plus a JSON delivery trace.
 *
 * @details
 * ## Two outputs, one object
 * - **Log lines** are for people and grep:
 *   `2026-10-19T14:03:22.120Z level=warn event=not_tracked msg_id=17 from=555`
 *   Same register as the serial tools (`status=ok seq=1 id=N3`): one event per
 *   line, flat `key=value` pairs, values quoted only when they contain spaces.
 * - **Trace lines** are for machines: one JSON object per registry transition
 *   or delivery callback, enough to replay the state machine of any message id
 *   (`jq 'select(.message_id==17)' events.jsonl`). When no trace sink is set,
 *   trace records fall back to the log sinks at debug level.
 *
 * ## Threading
 * One mutex guards the sink list and every write. Callers on the transport
 * thread and the host loop may log concurrently; lines never interleave.
 * Components never log while holding their own state lock.
 */
#ifndef MESHWX_LOG_HPP
#define MESHWX_LOG_HPP

#include <cstdint>
#include <initializer_list>
#include <iomanip>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace meshwx {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Lowercase level name as it appears in `level=` fields.
const char* to_string(LogLevel level);

/// Parse "debug" / "info" / "warn" / "error"; false leaves @p out untouched.
bool parse_log_level(const std::string& text, LogLevel& out);

/// One `key=value` pair of a log line. Floats render with two decimals.
struct LogField {
  std::string key;
  std::string value;

  LogField(std::string k, std::string v) : key(std::move(k)), value(std::move(v)) {}
  LogField(std::string k, const char* v) : key(std::move(k)), value(v ? v : "") {}
  LogField(std::string k, float v) : LogField(std::move(k), static_cast<double>(v)) {}
  LogField(std::string k, double v) : key(std::move(k)) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << v;
    value = os.str();
  }
  LogField(std::string k, const std::optional<float>& v)
  : LogField(std::move(k), v ? LogField("", *v).value : std::string("-")) {}

  template <typename T>
  LogField(std::string k, const T& v) : key(std::move(k)) {
    std::ostringstream os;
    os << v;
    value = os.str();
  }
};

/// Structured delivery trace entry (serialized as one JSON line).
struct TraceRecord {
  std::string event;                    ///< REGISTER, RESOLVE, DUPLICATE, NOT_TRACKED, TIMEOUT, ...
  uint32_t message_id{0};
  std::string node;
  uint64_t sent_at_ms{0};
  std::optional<uint64_t> acked_at_ms;
  std::string outcome;                  ///< state name after the event
  std::string detail;                   ///< free text: reason, from-node, error code
};

/// Serialize a trace record as compact JSON with a `ts` field.
std::string trace_json(const TraceRecord& rec, uint64_t ts_ms);

class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::Info);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  /// Add a destination for log lines. The stream must outlive the logger.
  void add_sink(std::ostream& out);

  /// Destination for JSON trace lines; nullptr routes traces to the log sinks.
  void set_trace_sink(std::ostream* out);

  void set_level(LogLevel level);
  LogLevel level() const;

  void log(LogLevel level, const std::string& event, std::initializer_list<LogField> fields = {});
  void debug(const std::string& event, std::initializer_list<LogField> fields = {}) { log(LogLevel::Debug, event, fields); }
  void info (const std::string& event, std::initializer_list<LogField> fields = {}) { log(LogLevel::Info,  event, fields); }
  void warn (const std::string& event, std::initializer_list<LogField> fields = {}) { log(LogLevel::Warn,  event, fields); }
  void error(const std::string& event, std::initializer_list<LogField> fields = {}) { log(LogLevel::Error, event, fields); }

  /// Emit one delivery trace record.
  void trace(const TraceRecord& rec);

private:
  void write_line_locked(const std::string& line);

  mutable std::mutex mu_;
  std::vector<std::ostream*> sinks_;
  std::ostream* trace_sink_{nullptr};
  LogLevel min_level_;
};

} // namespace meshwx

#endif // MESHWX_LOG_HPP
