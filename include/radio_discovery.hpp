#pragma once
/**
 * @file radio_discovery.hpp
 * @brief Find USB-attached mesh radios and learn their node numbers.
 *
 * @details
 * Used when no device is configured, and by `meshwx-station --scan`.
 *
 * Strategy:
 * - Prefer /dev/serial/by-id (stable names across reboots and ports).
 * - Fall back to /dev/ttyACM* and /dev/ttyUSB* when that directory is absent.
 * - Probe each candidate with GET_NODE_NUM; a reply marks it online.
 *
 * Probing opens the port, which resets many boards. Do not scan a radio
 * another process is using.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meshwx {

class Logger;

struct RadioInfo {
    std::string dev_path;               ///< canonical device, e.g. /dev/ttyACM0
    std::string by_id;                  ///< /dev/serial/by-id link, if any
    std::optional<uint32_t> node_num;   ///< set when the probe answered
    bool online() const { return node_num.has_value(); }
};

/// Candidate device paths without probing.
std::vector<RadioInfo> list_serial_candidates();

/// Candidates plus a GET_NODE_NUM probe of each.
std::vector<RadioInfo> discover_radios(Logger& log, int baud = 115200, int timeout_ms = 1200);

/// First online radio, if any.
std::optional<RadioInfo> first_online(const std::vector<RadioInfo>& radios);

/**
 * @brief Write the roster as JSON to `<state_dir>/radios.json`.
 * @return false on failure (logged).
 */
bool save_roster(const std::vector<RadioInfo>& radios, const std::string& state_dir, Logger& log);

} // namespace meshwx
