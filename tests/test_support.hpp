#pragma once
// Shared fixtures for the meshwx tests: a scratch directory and an in-memory radio.

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

#include "meshwx/errors.hpp"
#include "meshwx/transport/transport.hpp"
#include "radio_frames.hpp"

namespace meshwx {
namespace testing {

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("meshwx-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

struct SentText {
    uint32_t node_id;
    std::string payload;
    uint8_t channel;
    EncryptionMode mode;
    uint32_t packet_id;
};

/// Radio stand-in: assigns sequential packet ids and lets a test inject delivery reports.
class FakeTransport : public IMeshTransport {
public:
    uint32_t local_id = 0x100;
    uint32_t next_packet_id = 1;
    int fail_sends = 0;                       ///< throw TransportError for this many sends
    std::vector<SentText> sent;
    std::map<uint32_t, NodeLink> links;

    uint32_t send_text(uint32_t node_id, const std::string& payload,
                       uint8_t channel, EncryptionMode mode) override {
        if (fail_sends > 0) {
            --fail_sends;
            throw TransportError("radio busy");
        }
        const uint32_t id = next_packet_id++;
        sent.push_back({node_id, payload, channel, mode, id});
        return id;
    }

    uint32_t local_node_id() const override { return local_id; }

    NodeLink node_link(uint32_t node_id) override {
        auto it = links.find(node_id);
        return it == links.end() ? NodeLink{} : it->second;
    }

    void set_delivery_listener(DeliveryListener l) override { listener = std::move(l); }

    std::string name() const override { return "fake"; }

    /// Push one EVT_DELIVERY frame through the listener, as the reader thread would.
    void deliver(uint32_t packet_id, uint32_t from, const std::string& error = "",
                 std::optional<float> snr = std::nullopt) {
        radio::DeliveryEvent ev;
        ev.packet_id = packet_id;
        ev.from = from;
        ev.error = error;
        ev.snr = snr;
        if (listener) listener(radio::make_delivery_event(ev));
    }

    DeliveryListener listener;
};

} // namespace testing
} // namespace meshwx
