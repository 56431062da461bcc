/**
 * @file message_template.hpp
 * @brief Telemetry text rendering from `{name}` templates.
 *
 * Placeholders are `{name}`; `{{` and `}}` produce literal braces. A
 * placeholder with no value is left in the text unchanged so a typo shows
 * up in the received message instead of silently vanishing.
 *
 * Fields filled by telemetry_fields():
 *   date (MM/DD), time (HH:MM), time_detail (HH:MM:SS), online, total,
 *   temp (°F, truncated), humidity (%, truncated), snr (one decimal or "--"),
 *   hops (or "--"), ack (delivery marker of the previous message).
 */
#ifndef MESHWX_MESSAGE_TEMPLATE_HPP
#define MESHWX_MESSAGE_TEMPLATE_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace meshwx {

using TemplateFields = std::map<std::string, std::string>;

std::string render_template(const std::string& tmpl, const TemplateFields& fields);

/// One sensor sample as written by the external sampler.
struct SensorReading {
  double temperature_f{0.0};
  double humidity{0.0};
};

/**
 * @brief Read `{"temperature_f": 71.6, "humidity": 40.2}` (or `temperature_c`).
 * @return false (with @p error set) if the file is missing or unusable.
 */
bool read_sensor_reading(const std::string& path, SensorReading& out, std::string& error);

struct TelemetryInputs {
  uint64_t now_ms{0};
  std::optional<SensorReading> reading;
  unsigned online{0};
  unsigned total{0};
  std::optional<float> snr;
  std::optional<uint8_t> hops;
  std::string ack{"--"};
};

TemplateFields telemetry_fields(const TelemetryInputs& in);

} // namespace meshwx

#endif // MESHWX_MESSAGE_TEMPLATE_HPP
