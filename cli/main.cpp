/**
 * @file main.cpp
 * @brief meshwx-station — telemetry sender with delivery tracking for a USB mesh radio.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and load the JSON station config.
 *  - Pick the radio: --device, then radio.device, then discovery.
 *  - Run the cooperative loop: engine.on_tick() every tick_ms, one telemetry
 *    round every update_interval, reconnect when the radio disappears.
 *  - One-shot modes: --scan (radio roster), --report (SNR stats),
 *    --reset-stats (needs --yes and --confirm RESET, or both typed on a tty).
 *
 * Exit codes: 0 ok, 1 runtime failure, 2 bad config or usage.
 * Results and errors go to stdout/stderr as `status=... reason=...` lines.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "meshwx/clock.hpp"
#include "meshwx/config.hpp"
#include "meshwx/delivery_engine.hpp"
#include "meshwx/errors.hpp"
#include "meshwx/log.hpp"
#include "meshwx/message_template.hpp"
#include "meshwx/node_directory.hpp"
#include "meshwx/snr_stats.hpp"
#include "meshwx/transport/serial_radio.hpp"
#include "radio_discovery.hpp"

using json = nlohmann::json;
using namespace meshwx;

// ---------- signals ----------

static std::atomic<bool> g_stop{false};

static void on_signal(int) { g_stop.store(true); }

static void install_signal_handlers() {
  struct sigaction sa {};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

// ---------- small utilities ----------

static bool is_tty_stdin() { return ::isatty(fileno(stdin)); }

static std::string fmt1(float v) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(1) << v;
  return os.str();
}

/// Heard within this window counts as online.
static constexpr uint32_t ONLINE_WINDOW_S = 15 * 60;

// ---------- --report ----------

static int run_report(const StationConfig& cfg, Logger& log, const std::string& format) {
  SnrStatsStore store(cfg.stats_file, 0, log);
  if (!store.load()) {
    std::cerr << "status=error reason=stats_unreadable path=" << cfg.stats_file << "\n";
    return 1;
  }
  const auto all = store.snapshot_all();

  if (format == "json") {
    json out = json::object();
    for (const auto& kv : all) {
      const SnrRecord& r = kv.second;
      json j;
      j["count"]      = r.count;
      j["min_snr"]    = r.min_snr;
      j["max_snr"]    = r.max_snr;
      j["avg_snr"]    = r.average() ? json(*r.average()) : json(nullptr);
      j["first_seen"] = r.first_seen_ms;
      j["last_seen"]  = r.last_seen_ms;
      j["recent"]     = r.recent_samples();
      out[kv.first] = j;
    }
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  if (all.empty()) {
    std::cout << "status=ok nodes=0\n";
    return 0;
  }
  for (const auto& kv : all) {
    const SnrRecord& r = kv.second;
    std::cout << "node=" << kv.first << " count=" << r.count;
    if (r.count > 0) {
      std::cout << " min=" << fmt1(r.min_snr) << " avg=" << fmt1(*r.average()) << " max=" << fmt1(r.max_snr)
                << " last_seen=" << format_local_time(r.last_seen_ms, "%Y-%m-%dT%H:%M:%S") << " recent=";
      const auto recent = r.recent_samples();
      for (size_t i = 0; i < recent.size(); ++i) std::cout << (i ? "," : "") << fmt1(recent[i]);
    }
    std::cout << "\n";
  }
  return 0;
}

// ---------- --reset-stats ----------

static int run_reset(const StationConfig& cfg, Logger& log, bool yes, std::string phrase) {
  ResetConfirmation c;
  c.acknowledged = yes;
  c.typed_phrase = phrase;

  // Interactive fallback: ask for each confirmation that was not given.
  if (is_tty_stdin()) {
    if (!c.acknowledged) {
      std::cout << "Erase all SNR statistics in " << cfg.stats_file << "? [y/N] " << std::flush;
      std::string answer;
      std::getline(std::cin, answer);
      c.acknowledged = (answer == "y" || answer == "Y" || answer == "yes");
    }
    if (c.acknowledged && c.typed_phrase.empty()) {
      std::cout << "Type " << RESET_PHRASE << " to confirm: " << std::flush;
      std::getline(std::cin, c.typed_phrase);
    }
  }

  SnrStatsStore store(cfg.stats_file, 0, log);
  if (!store.load()) {
    std::cerr << "status=error reason=stats_unreadable path=" << cfg.stats_file << "\n";
    return 1;
  }
  if (!store.reset_all(c)) {
    std::cerr << "status=error reason=not_confirmed\n";
    return 1;
  }
  std::cout << "status=ok reset=1 path=" << cfg.stats_file << "\n";
  return 0;
}

// ---------- --scan ----------

static int run_scan(const StationConfig& cfg, Logger& log) {
  const auto radios = discover_radios(log, cfg.baud, cfg.timeout_ms);
  for (const auto& r : radios) {
    std::cout << "dev=" << r.dev_path
              << " node=" << (r.node_num ? format_node_id(*r.node_num) : std::string("-"))
              << " online=" << (r.online() ? 1 : 0);
    if (!r.by_id.empty()) std::cout << " by_id=" << r.by_id;
    std::cout << "\n";
  }
  const bool saved = save_roster(radios, default_state_dir(), log);
  std::cout << "status=ok radios=" << radios.size() << " roster_saved=" << (saved ? 1 : 0) << "\n";
  return 0;
}

// ---------- station loop ----------

struct Station {
  const StationConfig& cfg;
  const NodeDirectory& nodes;
  SerialRadio& radio;
  DeliveryEngine& engine;
  Logger& log;
  std::string reading_file;

  /// Count configured peers heard recently; the local radio is not a peer.
  void count_online(uint64_t now_ms, unsigned& online, unsigned& total) {
    online = 0;
    total = 0;
    const uint32_t local = radio.local_node_id();
    for (const auto& n : nodes.nodes()) {
      if (n.id == local) continue;
      ++total;
      try {
        const NodeLink link = radio.node_link(n.id);
        if (link.last_heard_s && now_ms / 1000 < uint64_t(*link.last_heard_s) + ONLINE_WINDOW_S) ++online;
      } catch (const TransportError& e) {
        log.debug("node_link_failed", {{"node", n.name}, {"reason", e.what()}});
      }
    }
  }

  void send_round(uint64_t now_ms) {
    SensorReading reading;
    std::string why;
    if (!read_sensor_reading(reading_file, reading, why)) {
      log.warn("no_reading", {{"path", reading_file}, {"reason", why}});
      return;
    }

    std::vector<std::string> targets;
    try {
      targets = nodes.targets_for(radio.local_node_id(), cfg.selected_node);
    } catch (const NotFoundError& e) {
      log.error("no_target", {{"selected", cfg.selected_node}, {"reason", e.what()}});
      return;
    }

    TelemetryInputs in;
    in.now_ms = now_ms;
    in.reading = reading;
    count_online(now_ms, in.online, in.total);

    for (const auto& target : targets) {
      const Node& node = nodes.resolve(target);
      try {
        const NodeLink link = radio.node_link(node.id);
        in.snr = link.snr;
        in.hops = link.hops;
      } catch (const TransportError&) {
        in.snr.reset();
        in.hops.reset();
      }
      in.ack = engine.ack_indicator(target);

      const std::string text = render_template(cfg.active_template(), telemetry_fields(in));
      try {
        engine.send(target, text, now_ms);
      } catch (const Error& e) {
        log.error("send_round_failed", {{"node", target}, {"reason", e.what()}});
      }
    }
  }

  /// Reopen the radio if it went away. True when it is usable.
  bool ensure_connected(uint64_t now_ms, uint64_t& next_attempt_ms) {
    if (radio.connected()) return true;
    if (now_ms < next_attempt_ms) return false;
    next_attempt_ms = now_ms + seconds_to_ms(cfg.reconnect_interval_s);
    if (!radio.open()) return false;
    engine.attach_transport();
    return true;
  }
};

static std::string pick_device(const StationConfig& cfg, const std::string& cli_device, Logger& log) {
  if (!cli_device.empty()) return cli_device;
  if (!cfg.device.empty()) return cfg.device;
  const auto found = first_online(discover_radios(log, cfg.baud, cfg.timeout_ms));
  return found ? found->dev_path : std::string();
}

static int run_station(const StationConfig& cfg, Logger& log, const std::string& device,
                       const std::string& reading_file, bool once) {
  NodeDirectory nodes(cfg.nodes);
  if (nodes.size() == 0) {
    std::cerr << "status=error reason=no_nodes_configured\n";
    return 2;
  }

  SerialRadioOptions ro;
  ro.device = device;
  ro.baud = cfg.baud;
  ro.timeout_ms = cfg.timeout_ms;
  SerialRadio radio(ro, log);

  EngineOptions eo;
  eo.channel = cfg.channel;
  eo.retry.ack_timeout_s = cfg.ack_retry_timeout_s;
  eo.retry.max_retries = cfg.max_retries;
  eo.retry.retention_s = cfg.retention_s;
  eo.ack.confirmation_delay_s = cfg.confirmation_delay_s;
  eo.ack.confirmations = cfg.confirmations;
  eo.stats_file = cfg.stats_file;
  eo.stats_autosave_every = cfg.autosave_every;
  DeliveryEngine engine(radio, nodes, eo, log);

  if (!radio.open()) {
    std::cerr << "status=error reason=radio_unavailable device=" << device << "\n";
    return 1;
  }
  engine.start();

  Station station{cfg, nodes, radio, engine, log, reading_file};
  install_signal_handlers();

  uint64_t next_send = 0;
  uint64_t next_reconnect = 0;
  uint64_t once_deadline = 0;
  bool sent_once = false;

  while (!g_stop.load()) {
    const uint64_t now = now_ms_system();

    if (station.ensure_connected(now, next_reconnect)) {
      engine.on_tick(now);

      if (!sent_once || !once) {
        if (now >= next_send) {
          station.send_round(now);
          next_send = now + seconds_to_ms(cfg.update_interval_s);
          if (once) {
            sent_once = true;
            // Long enough for every retry plus the confirmation.
            once_deadline = now + seconds_to_ms(cfg.ack_retry_timeout_s) * (cfg.max_retries + 1u) +
                            seconds_to_ms(cfg.confirmation_delay_s) + cfg.tick_ms * 2u;
          }
        }
      }
    }

    if (sent_once && (engine.in_flight() == 0 || now >= once_deadline)) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg.tick_ms));
  }

  engine.shutdown();
  radio.close();

  if (const auto s = engine.latest_status()) {
    std::cout << "status=ok last_msg_id=" << s->message_id << " node=" << s->node_name
              << " outcome=" << to_string(s->outcome) << " retries=" << unsigned(s->retry_count);
    if (s->snr) std::cout << " snr=" << fmt1(*s->snr);
    if (s->nak_reason) std::cout << " reason=" << *s->nak_reason;
    std::cout << "\n";
  }
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config;
  std::string opt_device;
  std::string opt_reading;
  std::string opt_log_level;
  std::string opt_format = "text";
  std::string opt_confirm;
  bool opt_once = false;
  bool opt_scan = false;
  bool opt_report = false;
  bool opt_reset = false;
  bool opt_yes = false;

  CLI::App app{"meshwx-station: mesh telemetry sender with delivery tracking"};

  app.add_option("--config", opt_config, "Config file (default: $XDG_CONFIG_HOME/meshwx/config.json)");
  app.add_option("--device", opt_device, "Radio serial device (overrides radio.device)");
  app.add_option("--reading", opt_reading, "Sensor reading JSON (overrides settings.reading_file)");
  app.add_option("--log-level", opt_log_level, "debug|info|warn|error")
      ->check(CLI::IsMember({"debug", "info", "warn", "error"}));
  app.add_flag("--once", opt_once, "Send one round, wait for outcomes, exit");

  auto* scan   = app.add_flag("--scan", opt_scan, "List and probe serial radios, save roster");
  auto* report = app.add_flag("--report", opt_report, "Print per-node SNR statistics");
  auto* reset  = app.add_flag("--reset-stats", opt_reset, "Erase SNR statistics (needs --yes and --confirm RESET)");
  scan->excludes(report)->excludes(reset);
  report->excludes(reset);

  app.add_option("--format", opt_format, "Report format: text|json")->check(CLI::IsMember({"text", "json"}));
  app.add_flag("--yes", opt_yes, "First confirmation for --reset-stats");
  app.add_option("--confirm", opt_confirm, "Second confirmation for --reset-stats: the word RESET");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  StationConfig cfg;
  const std::string config_path = opt_config.empty() ? default_config_path() : opt_config;
  try {
    cfg = load_config(config_path);
  } catch (const ConfigError& e) {
    std::cerr << "status=error reason=config path=" << config_path << " detail=\"" << e.what() << "\"\n";
    return 2;
  }

  Logger log(cfg.log_level);
  if (!opt_log_level.empty()) {
    LogLevel lvl;
    if (parse_log_level(opt_log_level, lvl)) log.set_level(lvl);
  }
  log.add_sink(std::cerr);

  std::unique_ptr<std::ofstream> log_file;
  if (!cfg.log_file.empty()) {
    log_file = std::make_unique<std::ofstream>(cfg.log_file, std::ios::app);
    if (*log_file) log.add_sink(*log_file);
    else std::cerr << "status=warn reason=log_file_unwritable path=" << cfg.log_file << "\n";
  }
  std::unique_ptr<std::ofstream> event_log;
  if (!cfg.event_log.empty()) {
    event_log = std::make_unique<std::ofstream>(cfg.event_log, std::ios::app);
    if (*event_log) log.set_trace_sink(event_log.get());
    else std::cerr << "status=warn reason=event_log_unwritable path=" << cfg.event_log << "\n";
  }

  log.info("config_loaded", {{"path", config_path}, {"nodes", cfg.nodes.size()},
                             {"selected", cfg.selected_node}, {"template", cfg.message_template}});

  if (opt_scan)   return run_scan(cfg, log);
  if (opt_report) return run_report(cfg, log, opt_format);
  if (opt_reset)  return run_reset(cfg, log, opt_yes, opt_confirm);

  const std::string device = pick_device(cfg, opt_device, log);
  if (device.empty()) {
    std::cerr << "status=error reason=no_radio_found\n";
    return 1;
  }

  int rc = 1;
  try {
    rc = run_station(cfg, log, device, opt_reading.empty() ? cfg.reading_file : opt_reading, opt_once);
  } catch (const Error& e) {
    log.error("station_failed", {{"reason", e.what()}});
    std::cerr << "status=error reason=\"" << e.what() << "\"\n";
  }
  log.set_trace_sink(nullptr);
  return rc;
}
