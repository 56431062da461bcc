#include "meshwx/message_template.hpp"
#include "meshwx/clock.hpp"
#include "meshwx/errors.hpp"
#include "meshwx/json_file.hpp"

#include <cstdio>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace meshwx {

std::string render_template(const std::string& tmpl, const TemplateFields& fields) {
  std::string out;
  out.reserve(tmpl.size() + 32);

  size_t i = 0;
  while (i < tmpl.size()) {
    const char c = tmpl[i];
    if (c == '{' && i + 1 < tmpl.size() && tmpl[i + 1] == '{') { out.push_back('{'); i += 2; continue; }
    if (c == '}' && i + 1 < tmpl.size() && tmpl[i + 1] == '}') { out.push_back('}'); i += 2; continue; }

    if (c == '{') {
      const size_t close = tmpl.find('}', i + 1);
      if (close != std::string::npos) {
        const std::string key = tmpl.substr(i + 1, close - i - 1);
        auto it = fields.find(key);
        if (it != fields.end()) {
          out += it->second;
        } else {
          out.append(tmpl, i, close - i + 1);
        }
        i = close + 1;
        continue;
      }
    }
    out.push_back(c);
    ++i;
  }
  return out;
}

bool read_sensor_reading(const std::string& path, SensorReading& out, std::string& error) {
  json doc;
  try {
    if (!read_json_file(path, doc)) {
      error = "missing";
      return false;
    }
  } catch (const PersistenceError& e) {
    error = e.what();
    return false;
  }

  if (!doc.is_object() || !doc.contains("humidity") || !doc["humidity"].is_number()) {
    error = "no numeric humidity";
    return false;
  }

  SensorReading r;
  r.humidity = doc["humidity"].get<double>();
  if (doc.contains("temperature_f") && doc["temperature_f"].is_number()) {
    r.temperature_f = doc["temperature_f"].get<double>();
  } else if (doc.contains("temperature_c") && doc["temperature_c"].is_number()) {
    r.temperature_f = doc["temperature_c"].get<double>() * 9.0 / 5.0 + 32.0;
  } else {
    error = "no numeric temperature_f or temperature_c";
    return false;
  }
  out = r;
  return true;
}

TemplateFields telemetry_fields(const TelemetryInputs& in) {
  TemplateFields f;
  f["date"]        = format_local_time(in.now_ms, "%m/%d");
  f["time"]        = format_local_time(in.now_ms, "%H:%M");
  f["time_detail"] = format_local_time(in.now_ms, "%H:%M:%S");
  f["online"]      = std::to_string(in.online);
  f["total"]       = std::to_string(in.total);

  if (in.reading) {
    f["temp"]     = std::to_string(static_cast<long>(in.reading->temperature_f));
    f["humidity"] = std::to_string(static_cast<long>(in.reading->humidity));
  } else {
    f["temp"]     = "--";
    f["humidity"] = "--";
  }

  // SNR and hops are shown together or not at all.
  if (in.snr && in.hops) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.1f", static_cast<double>(*in.snr));
    f["snr"]  = buf;
    f["hops"] = std::to_string(unsigned(*in.hops));
  } else {
    f["snr"]  = "--";
    f["hops"] = "--";
  }

  f["ack"] = in.ack;
  return f;
}

} // namespace meshwx
