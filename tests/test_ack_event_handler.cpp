#include <doctest/doctest.h>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

#include "meshwx/ack_event_handler.hpp"
#include "radio_frames.hpp"

using namespace meshwx;

namespace {

// Registry, stats and scheduler wired to one handler with a hand-driven clock.
struct Rig {
    Logger log{LogLevel::Error};
    uint64_t now = 0;
    PendingMessageRegistry registry{log};
    SnrStatsStore stats{"", 0, log};
    ConfirmationScheduler confirmations{log};
    AckEventHandler handler;

    explicit Rig(AckEventHandler::Options opts = {})
    : handler(registry, stats, confirmations, opts, log, [this] { return now; }) {
        handler.set_local_node_id(0x100);
    }
};

bool ends_with(const std::string& s, const std::string& tail) {
    return s.size() >= tail.size() && s.compare(s.size() - tail.size(), tail.size(), tail) == 0;
}

} // namespace

TEST_CASE("local report then remote report: implicit ack, real ack, sample, confirmation") {
    Rig rig;
    rig.registry.register_message(1, "yang", 0, 9.5f);

    rig.now = 100;
    rig.handler.on_delivery_event(1, 0x100, "NONE", std::nullopt);
    CHECK(rig.registry.find(1)->state == DeliveryState::ImplicitAck);
    CHECK_FALSE(rig.stats.snapshot("yang").has_value());
    CHECK(rig.confirmations.pending() == 0);

    rig.now = 2000;
    rig.handler.on_delivery_event(1, 555, "", 7.0f);
    auto e = rig.registry.find(1);
    REQUIRE(e.has_value());
    CHECK(e->state == DeliveryState::RealAck);
    CHECK(e->acked_at_ms == 2000u);
    CHECK(e->ack_snr == doctest::Approx(7.0f));

    auto rec = rig.stats.snapshot("yang");
    REQUIRE(rec.has_value());
    CHECK(rec->count == 1);
    CHECK(rec->min_snr == doctest::Approx(7.0f));
    CHECK(rec->max_snr == doctest::Approx(7.0f));
    CHECK(*rec->average() == doctest::Approx(7.0f));
    REQUIRE(rec->recent_samples().size() == 1);
    CHECK(rec->recent_samples()[0] == doctest::Approx(7.0f));

    CHECK(rig.confirmations.poll_due(11999).empty());
    auto due = rig.confirmations.poll_due(12000);
    REQUIRE(due.size() == 1);
    CHECK(due[0].node == "yang");
    CHECK(due[0].message_id == 1);
    CHECK(ends_with(due[0].payload, "SNR 7.0 dB"));

    auto c = rig.handler.counters();
    CHECK(c.handled == 2);
    CHECK(c.duplicates == 0);
}

TEST_CASE("repeated remote reports record one sample and arm one confirmation") {
    Rig rig;
    rig.registry.register_message(4, "yang", 0);

    rig.now = 500;
    rig.handler.on_delivery_event(4, 555, "NONE", 6.0f);
    rig.handler.on_delivery_event(4, 555, "NONE", 6.0f);
    rig.handler.on_delivery_event(4, 0x100, "NONE", std::nullopt);

    CHECK(rig.stats.snapshot("yang")->count == 1);
    CHECK(rig.confirmations.pending() == 1);
    CHECK(rig.handler.counters().duplicates == 2);
    CHECK(rig.registry.find(4)->state == DeliveryState::RealAck);
}

TEST_CASE("a report from the local node never counts as delivery") {
    Rig rig;
    rig.registry.register_message(2, "yang", 0);
    rig.handler.on_delivery_event(2, 0x100, "", 12.0f);
    rig.handler.on_delivery_event(2, 0x100, "", 12.0f);

    CHECK(rig.registry.find(2)->state == DeliveryState::ImplicitAck);
    CHECK_FALSE(rig.stats.snapshot("yang").has_value());
    CHECK(rig.confirmations.pending() == 0);
}

TEST_CASE("an error code resolves to Nak with the reason and no side effects") {
    Rig rig;
    rig.registry.register_message(3, "ying", 0);
    rig.handler.on_delivery_event(3, 0x100, "MAX_RETRANSMIT", std::nullopt);

    auto e = rig.registry.find(3);
    CHECK(e->state == DeliveryState::Nak);
    CHECK(*e->nak_reason == "MAX_RETRANSMIT");
    CHECK(rig.confirmations.pending() == 0);

    // A late positive report cannot overturn it.
    rig.handler.on_delivery_event(3, 555, "NONE", 3.0f);
    CHECK(rig.registry.find(3)->state == DeliveryState::Nak);
    CHECK_FALSE(rig.stats.snapshot("ying").has_value());
}

TEST_CASE("reports for unknown ids are counted and dropped") {
    Rig rig;
    rig.handler.on_delivery_event(77, 555, "NONE", 5.0f);
    CHECK(rig.handler.counters().not_tracked == 1);
    CHECK(rig.registry.size() == 0);
    CHECK(rig.stats.snapshot_all().empty());
}

TEST_CASE("a remote report without SNR falls back to the SNR known at send time") {
    Rig rig;
    rig.registry.register_message(5, "yang", 0, 4.25f);
    rig.handler.on_delivery_event(5, 555, "NONE", std::nullopt);
    CHECK(rig.registry.find(5)->ack_snr == doctest::Approx(4.25f));
    CHECK(rig.stats.snapshot("yang")->count == 1);

    rig.registry.register_message(6, "ying", 0);
    rig.handler.on_delivery_event(6, 556, "NONE", std::nullopt);
    CHECK(rig.registry.find(6)->state == DeliveryState::RealAck);
    CHECK_FALSE(rig.registry.find(6)->ack_snr.has_value());
    CHECK_FALSE(rig.stats.snapshot("ying").has_value());

    auto due = rig.confirmations.poll_due(60000);
    REQUIRE(due.size() == 2);
    CHECK(ends_with(due[1].payload, "SNR n/a"));
}

TEST_CASE("frames go through the decoder; malformed ones are counted") {
    Rig rig;
    rig.registry.register_message(8, "yang", 0);

    radio::DeliveryEvent ev;
    ev.packet_id = 8;
    ev.from = 555;
    ev.snr = 7.0f;
    rig.handler.on_delivery_frame(radio::make_delivery_event(ev));
    CHECK(rig.registry.find(8)->state == DeliveryState::RealAck);
    CHECK(rig.registry.find(8)->ack_snr == doctest::Approx(7.0f));

    rig.handler.on_delivery_frame({radio::EVT_DELIVERY, 0x00});
    rig.handler.on_delivery_frame({});
    CHECK(rig.handler.counters().malformed == 2);
}

TEST_CASE("a malformed frame leaves one MALFORMED trace line with the bytes") {
    Rig rig;
    std::ostringstream traces;
    rig.log.set_trace_sink(&traces);

    rig.handler.on_delivery_frame({radio::EVT_DELIVERY, 0x00});
    const std::string out = traces.str();
    CHECK(out.find("\"event\":\"MALFORMED\"") != std::string::npos);
    CHECK(out.find("frame=[") != std::string::npos);
    CHECK(std::count(out.begin(), out.end(), '\n') == 1);
}

TEST_CASE("with confirmations off a real ack still records the sample") {
    AckEventHandler::Options opts;
    opts.confirmations = false;
    Rig rig(opts);
    rig.registry.register_message(9, "yang", 0);
    rig.handler.on_delivery_event(9, 555, "NONE", -3.5f);

    CHECK(rig.stats.snapshot("yang")->count == 1);
    CHECK(rig.confirmations.pending() == 0);
}

TEST_CASE("success codes are empty or NONE in any case") {
    CHECK(AckEventHandler::is_success_code(""));
    CHECK(AckEventHandler::is_success_code("NONE"));
    CHECK(AckEventHandler::is_success_code("none"));
    CHECK_FALSE(AckEventHandler::is_success_code("NO_ROUTE"));
    CHECK_FALSE(AckEventHandler::is_success_code("NONE "));
}
