/**
 * @file radio_discovery.cpp
 */
#include "radio_discovery.hpp"
#include "meshwx/errors.hpp"
#include "meshwx/json_file.hpp"
#include "meshwx/log.hpp"
#include "meshwx/node_directory.hpp"
#include "radio_frames.hpp"
#include "serial_io.hpp"

#include <filesystem>
#include <glob.h>
#include <system_error>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace meshwx {

static constexpr int PROBE_BOOT_MS = 400;

/*
 * probe_node_num()
 * ----------------
 * open → GET_NODE_NUM → one reply → close. Any failure is just "not a radio".
 */
static std::optional<uint32_t> probe_node_num(const std::string& dev, int baud, int timeout_ms,
                                              Logger& log) {
    SerialPort port;
    if (!port.open(dev, baud, PROBE_BOOT_MS)) {
        log.debug("probe_open_failed", {{"device", dev}, {"reason", port.last_error()}});
        return std::nullopt;
    }

    std::vector<uint8_t> reply;
    if (!port.write_frame(radio::make_get_node_num(1)) || !port.read_frame(reply, timeout_ms)) {
        log.debug("probe_no_reply", {{"device", dev}, {"reason", port.last_error()}});
        return std::nullopt;
    }

    uint32_t id = 0;
    if (!radio::parse_node_num(reply, id)) {
        log.debug("probe_bad_reply", {{"device", dev}, {"frame", radio::describe_frame(reply)}});
        return std::nullopt;
    }
    return id;
}

static void append_glob(std::vector<RadioInfo>& out, const char* pattern) {
    glob_t g{};
    if (glob(pattern, 0, nullptr, &g) == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i) {
            RadioInfo r;
            r.dev_path = g.gl_pathv[i];
            out.push_back(r);
        }
    }
    globfree(&g);
}

std::vector<RadioInfo> list_serial_candidates() {
    std::vector<RadioInfo> out;
    const fs::path by_id("/dev/serial/by-id");
    std::error_code ec;

    if (fs::is_directory(by_id, ec)) {
        for (const auto& e : fs::directory_iterator(by_id, ec)) {
            if (!e.is_symlink(ec)) continue;
            const auto canon = fs::canonical(e.path(), ec);
            if (ec) continue;
            RadioInfo r;
            r.dev_path = canon.string();
            r.by_id = e.path().string();
            out.push_back(r);
        }
        if (!out.empty()) return out;
    }

    append_glob(out, "/dev/ttyACM*");
    append_glob(out, "/dev/ttyUSB*");
    return out;
}

std::vector<RadioInfo> discover_radios(Logger& log, int baud, int timeout_ms) {
    auto radios = list_serial_candidates();
    for (auto& r : radios) {
        r.node_num = probe_node_num(r.dev_path, baud, timeout_ms, log);
        log.info("radio_probe", {{"device", r.dev_path},
                                 {"node", r.node_num ? format_node_id(*r.node_num) : std::string("-")}});
    }
    return radios;
}

std::optional<RadioInfo> first_online(const std::vector<RadioInfo>& radios) {
    for (const auto& r : radios) {
        if (r.online()) return r;
    }
    return std::nullopt;
}

bool save_roster(const std::vector<RadioInfo>& radios, const std::string& state_dir, Logger& log) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : radios) {
        nlohmann::json j;
        j["dev_path"] = r.dev_path;
        j["by_id"]    = r.by_id;
        j["online"]   = r.online();
        if (r.node_num) {
            j["node_num"] = *r.node_num;
            j["node_id"]  = format_node_id(*r.node_num);
        } else {
            j["node_num"] = nullptr;
        }
        arr.push_back(j);
    }

    const std::string path = (fs::path(state_dir) / "radios.json").string();
    try {
        atomic_write_json(path, arr);
    } catch (const PersistenceError& e) {
        log.error("roster_save_failed", {{"path", path}, {"reason", e.what()}});
        return false;
    }
    log.info("roster_saved", {{"path", path}, {"radios", radios.size()}});
    return true;
}

} // namespace meshwx
