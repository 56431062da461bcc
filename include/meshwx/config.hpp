/**
 * @file config.hpp
 * @brief Station configuration: one JSON file, every field defaulted.
 *
 * @details
 * Example (all sections optional):
 * @code{.json}
 * {
 *   "nodes":    { "yang": "!9e757a8c", "ying": { "id": 2658499212, "public_key": "0a1b..." } },
 *   "settings": { "selected_node": "yang", "update_interval": 60, "channel": 0,
 *                 "message_template": "template1", "tick_ms": 1000,
 *                 "reading_file": "reading.json" },
 *   "message_templates": { "short": "{time} {temp}F {ack}" },
 *   "delivery": { "ack_retry_timeout": 60, "max_retries": 1, "confirmation_delay": 10,
 *                 "confirmations": true, "retention": 600 },
 *   "stats":    { "file": "snr_stats.json", "autosave_every": 10 },
 *   "logging":  { "log_file": "", "event_log": "", "level": "info" },
 *   "radio":    { "device": "", "baud": 115200, "timeout_ms": 1500,
 *                 "reconnect_interval": 10 }
 * }
 * @endcode
 * Relative file paths are resolved against the directory of the config file.
 */
#ifndef MESHWX_CONFIG_HPP
#define MESHWX_CONFIG_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "meshwx/log.hpp"
#include "meshwx/node_directory.hpp"

#include <nlohmann/json_fwd.hpp>

namespace meshwx {

/// Template used when none is configured or the selected one is missing.
extern const char* const DEFAULT_TEMPLATE;

struct StationConfig {
  std::vector<Node> nodes;

  // settings
  std::string selected_node{"yang"};
  uint32_t update_interval_s{60};
  uint8_t channel{0};
  std::string message_template{"template1"};
  uint32_t tick_ms{1000};
  std::string reading_file{"reading.json"};  ///< sensor reading written by the sampler

  std::map<std::string, std::string> templates;   ///< always contains "template1"

  // delivery
  uint32_t ack_retry_timeout_s{60};
  uint8_t max_retries{1};
  uint32_t confirmation_delay_s{10};
  bool confirmations{true};
  uint32_t retention_s{600};

  // stats
  std::string stats_file{"snr_stats.json"};
  uint32_t autosave_every{10};

  // logging
  std::string log_file;
  std::string event_log;
  LogLevel log_level{LogLevel::Info};

  // radio
  std::string device;
  int baud{115200};
  int timeout_ms{1500};
  uint32_t reconnect_interval_s{10};

  /// Text of the selected template, falling back to template1.
  const std::string& active_template() const;
};

/**
 * @brief Load a configuration file.
 * A missing file yields the defaults (with relative paths kept as given).
 * @throws ConfigError if the file is unreadable, not JSON, or has a field of the wrong type.
 */
StationConfig load_config(const std::string& path);

/// Parse an already-loaded document. @p base_dir resolves relative paths ("" keeps them).
StationConfig config_from_json(const nlohmann::json& doc, const std::string& base_dir);

/// $XDG_CONFIG_HOME/meshwx/config.json, else ~/.config/meshwx/config.json.
std::string default_config_path();

/// $XDG_STATE_HOME/meshwx, else ~/.local/state/meshwx.
std::string default_state_dir();

} // namespace meshwx

#endif // MESHWX_CONFIG_HPP
