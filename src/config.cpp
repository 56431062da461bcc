#include "meshwx/config.hpp"
#include "meshwx/errors.hpp"
#include "meshwx/json_file.hpp"

#include <cstdlib>
#include <filesystem>
#include <limits>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using nlohmann::json;

namespace meshwx {

const char* const DEFAULT_TEMPLATE =
    "{date} {time} ({online}/{total})\nT: {temp}F {snr} snr/{hops} hop\nH: {humidity}% {time_detail}";

const std::string& StationConfig::active_template() const {
  auto it = templates.find(message_template);
  if (it != templates.end()) return it->second;
  return templates.at("template1");
}

namespace {

// ---------------------------------------------------------------------------
// Typed field readers. Absent keys keep the default; present keys must have
// the right type or the whole load fails with the dotted field name.
// ---------------------------------------------------------------------------
const json* section(const json& doc, const char* name) {
  if (!doc.contains(name)) return nullptr;
  const json& s = doc.at(name);
  if (!s.is_object()) throw ConfigError(std::string(name) + ": expected an object");
  return &s;
}

void read_string(const json* sec, const char* sec_name, const char* key, std::string& out) {
  if (!sec || !sec->contains(key)) return;
  const json& v = sec->at(key);
  if (!v.is_string()) throw ConfigError(std::string(sec_name) + "." + key + ": expected a string");
  out = v.get<std::string>();
}

void read_bool(const json* sec, const char* sec_name, const char* key, bool& out) {
  if (!sec || !sec->contains(key)) return;
  const json& v = sec->at(key);
  if (!v.is_boolean()) throw ConfigError(std::string(sec_name) + "." + key + ": expected true/false");
  out = v.get<bool>();
}

template <typename T>
void read_uint(const json* sec, const char* sec_name, const char* key, T& out) {
  if (!sec || !sec->contains(key)) return;
  const json& v = sec->at(key);
  if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<long long>() >= 0)) {
    throw ConfigError(std::string(sec_name) + "." + key + ": expected a non-negative integer");
  }
  const auto u = v.get<unsigned long long>();
  if (u > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
    throw ConfigError(std::string(sec_name) + "." + key + ": out of range");
  }
  out = static_cast<T>(u);
}

bool parse_hex_bytes(const std::string& hex, std::vector<uint8_t>& out) {
  if (hex.empty() || hex.size() % 2) return false;
  out.clear();
  for (size_t i = 0; i < hex.size(); i += 2) {
    unsigned v = 0;
    for (size_t k = 0; k < 2; ++k) {
      const char c = hex[i + k];
      v <<= 4;
      if (c >= '0' && c <= '9')      v |= static_cast<unsigned>(c - '0');
      else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned>(c - 'A' + 10);
      else return false;
    }
    out.push_back(static_cast<uint8_t>(v));
  }
  return true;
}

uint32_t node_id_from(const std::string& name, const json& v) {
  if (v.is_number_unsigned() && v.get<unsigned long long>() <= 0xFFFFFFFFull) {
    return static_cast<uint32_t>(v.get<unsigned long long>());
  }
  uint32_t id = 0;
  if (v.is_string() && parse_node_id(v.get<std::string>(), id)) return id;
  throw ConfigError("nodes." + name + ": id must be a u32, \"!hex\" or decimal string");
}

Node node_from(const std::string& name, const json& v) {
  Node n;
  n.name = name;
  if (v.is_object()) {
    if (!v.contains("id")) throw ConfigError("nodes." + name + ": missing id");
    n.id = node_id_from(name, v.at("id"));
    if (v.contains("public_key") && !v.at("public_key").is_null()) {
      std::vector<uint8_t> key;
      const json& k = v.at("public_key");
      if (!k.is_string() || !parse_hex_bytes(k.get<std::string>(), key)) {
        throw ConfigError("nodes." + name + ".public_key: expected a hex string");
      }
      n.public_key = std::move(key);
    }
  } else {
    n.id = node_id_from(name, v);
  }
  return n;
}

std::string resolve_path(const std::string& p, const std::string& base_dir) {
  if (p.empty() || base_dir.empty() || fs::path(p).is_absolute()) return p;
  return (fs::path(base_dir) / p).string();
}

std::string home_dir() {
  const char* h = std::getenv("HOME");
  return h ? h : ".";
}

} // namespace

StationConfig config_from_json(const json& doc, const std::string& base_dir) {
  if (!doc.is_object()) throw ConfigError("top level must be a JSON object");

  StationConfig cfg;
  cfg.templates["template1"] = DEFAULT_TEMPLATE;

  if (const json* nodes = section(doc, "nodes")) {
    for (const auto& item : nodes->items()) {
      Node n = node_from(item.key(), item.value());
      for (const auto& prev : cfg.nodes) {
        if (prev.id == n.id) throw ConfigError("nodes." + n.name + ": id also used by " + prev.name);
      }
      cfg.nodes.push_back(std::move(n));
    }
  }

  const json* settings = section(doc, "settings");
  read_string(settings, "settings", "selected_node",    cfg.selected_node);
  read_uint  (settings, "settings", "update_interval",  cfg.update_interval_s);
  read_uint  (settings, "settings", "channel",          cfg.channel);
  read_string(settings, "settings", "message_template", cfg.message_template);
  read_uint  (settings, "settings", "tick_ms",          cfg.tick_ms);
  read_string(settings, "settings", "reading_file",     cfg.reading_file);
  if (cfg.update_interval_s == 0) throw ConfigError("settings.update_interval: must be > 0");
  if (cfg.tick_ms == 0) throw ConfigError("settings.tick_ms: must be > 0");

  if (const json* t = section(doc, "message_templates")) {
    for (const auto& item : t->items()) {
      if (!item.value().is_string()) throw ConfigError("message_templates." + item.key() + ": expected a string");
      cfg.templates[item.key()] = item.value().get<std::string>();
    }
  }

  const json* delivery = section(doc, "delivery");
  read_uint(delivery, "delivery", "ack_retry_timeout",  cfg.ack_retry_timeout_s);
  read_uint(delivery, "delivery", "max_retries",        cfg.max_retries);
  read_uint(delivery, "delivery", "confirmation_delay", cfg.confirmation_delay_s);
  read_bool(delivery, "delivery", "confirmations",      cfg.confirmations);
  read_uint(delivery, "delivery", "retention",          cfg.retention_s);
  if (cfg.ack_retry_timeout_s == 0) throw ConfigError("delivery.ack_retry_timeout: must be > 0");

  const json* stats = section(doc, "stats");
  read_string(stats, "stats", "file",           cfg.stats_file);
  read_uint  (stats, "stats", "autosave_every", cfg.autosave_every);

  const json* logging = section(doc, "logging");
  read_string(logging, "logging", "log_file",  cfg.log_file);
  read_string(logging, "logging", "event_log", cfg.event_log);
  std::string level;
  read_string(logging, "logging", "level", level);
  if (!level.empty() && !parse_log_level(level, cfg.log_level)) {
    throw ConfigError("logging.level: expected debug, info, warn or error");
  }

  const json* radio = section(doc, "radio");
  read_string(radio, "radio", "device",     cfg.device);
  read_uint  (radio, "radio", "baud",       cfg.baud);
  read_uint  (radio, "radio", "timeout_ms", cfg.timeout_ms);
  read_uint  (radio, "radio", "reconnect_interval", cfg.reconnect_interval_s);

  cfg.stats_file   = resolve_path(cfg.stats_file, base_dir);
  cfg.log_file     = resolve_path(cfg.log_file, base_dir);
  cfg.event_log    = resolve_path(cfg.event_log, base_dir);
  cfg.reading_file = resolve_path(cfg.reading_file, base_dir);
  return cfg;
}

StationConfig load_config(const std::string& path) {
  json doc;
  try {
    if (!read_json_file(path, doc)) {
      StationConfig cfg;
      cfg.templates["template1"] = DEFAULT_TEMPLATE;
      return cfg;
    }
  } catch (const PersistenceError& e) {
    throw ConfigError(e.what());
  }
  const std::string base = fs::path(path).has_parent_path() ? fs::path(path).parent_path().string() : "";
  return config_from_json(doc, base);
}

std::string default_config_path() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  const fs::path base = (xdg && *xdg) ? fs::path(xdg) : fs::path(home_dir()) / ".config";
  return (base / "meshwx" / "config.json").string();
}

std::string default_state_dir() {
  const char* xdg = std::getenv("XDG_STATE_HOME");
  const fs::path base = (xdg && *xdg) ? fs::path(xdg) : fs::path(home_dir()) / ".local" / "state";
  return (base / "meshwx").string();
}

} // namespace meshwx
