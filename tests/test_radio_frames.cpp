#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "meshwx/errors.hpp"
#include "radio_frames.hpp"
#include "slip.hpp"

using namespace meshwx;
using namespace meshwx::radio;

static std::string le32(uint32_t v) {
    std::string s(4, '\0');
    for (int i = 0; i < 4; ++i) s[i] = static_cast<char>((v >> (8 * i)) & 0xFF);
    return s;
}

TEST_CASE("SEND_TEXT carries destination, channel, encryption and text") {
    auto f = make_send_text(7, 555, 2, EncryptionMode::Pki, "T 71F");
    CHECK(frame_verb(f) == SEND_TEXT);
    CHECK(frame_seq(f) == 7);
    CHECK(f[3] == f.size() - HEADER_LEN);

    std::vector<Tlv> tlvs;
    REQUIRE(parse_tlvs(f, tlvs));
    uint32_t dest = 0;
    uint8_t ch = 0, enc = 0;
    REQUIRE(find_tlv(tlvs, TAG_DEST));
    CHECK(as_u32(find_tlv(tlvs, TAG_DEST)->val, dest));
    CHECK(dest == 555);
    CHECK(as_u8(find_tlv(tlvs, TAG_CHANNEL)->val, ch));
    CHECK(ch == 2);
    CHECK(as_u8(find_tlv(tlvs, TAG_ENCRYPTION)->val, enc));
    CHECK(enc == 1);
    CHECK(find_tlv(tlvs, TAG_TEXT)->val == "T 71F");
}

TEST_CASE("over-long text is cut at the radio limit") {
    auto f = make_send_text(1, 1, 0, EncryptionMode::Channel, std::string(400, 'x'));
    std::vector<Tlv> tlvs;
    REQUIRE(parse_tlvs(f, tlvs));
    CHECK(find_tlv(tlvs, TAG_TEXT)->val.size() == MAX_TEXT_LEN);
}

TEST_CASE("delivery events decode with quarter-dB SNR") {
    DeliveryEvent ev;
    ev.packet_id = 0xDEADBEEF;
    ev.from = 555;
    ev.error = "NO_ROUTE";
    ev.snr = -6.75f;

    auto back = parse_delivery_event(make_delivery_event(ev));
    CHECK(back.packet_id == 0xDEADBEEF);
    CHECK(back.from == 555);
    CHECK(back.error == "NO_ROUTE");
    REQUIRE(back.snr.has_value());
    CHECK(*back.snr == -6.75f);

    DeliveryEvent bare;
    bare.packet_id = 1;
    bare.from = 2;
    auto b = parse_delivery_event(make_delivery_event(bare));
    CHECK(b.error.empty());
    CHECK_FALSE(b.snr.has_value());
}

TEST_CASE("broken delivery frames raise CallbackParseError") {
    CHECK_THROWS_AS(parse_delivery_event({}), CallbackParseError);
    CHECK_THROWS_AS(parse_delivery_event(make_get_node_num(1)), CallbackParseError);

    // Missing FROM.
    std::vector<uint8_t> no_from = {EVT_DELIVERY, 0, 0, 6, TAG_PACKET_ID, 4, 1, 0, 0, 0};
    CHECK_THROWS_AS(parse_delivery_event(no_from), CallbackParseError);

    // Length byte claims more than is there.
    DeliveryEvent ev;
    ev.packet_id = 1;
    ev.from = 2;
    auto cut = make_delivery_event(ev);
    cut.pop_back();
    CHECK_THROWS_AS(parse_delivery_event(cut), CallbackParseError);
}

TEST_CASE("replies: node number, packet id, node info, error text") {
    uint32_t v = 0;
    CHECK(parse_node_num(make_resp_ok(1, {{TAG_NODE_NUM, le32(0x100)}}), v));
    CHECK(v == 0x100);
    CHECK_FALSE(parse_node_num(make_resp_err(1, "BUSY"), v));

    CHECK(parse_packet_id(make_resp_ok(2, {{TAG_PACKET_ID, le32(42)}}), v));
    CHECK(v == 42);
    CHECK_FALSE(parse_packet_id(make_resp_ok(2), v));

    const std::string snr_q4("\x1c\x00", 2);   // 28 -> 7.0 dB
    NodeLink link = parse_node_info(make_resp_ok(3, {{TAG_SNR_Q4, snr_q4}, {TAG_HOPS, std::string(1, '\x02')}}));
    REQUIRE(link.snr.has_value());
    CHECK(*link.snr == 7.0f);
    CHECK(*link.hops == 2);
    CHECK_FALSE(link.last_heard_s.has_value());

    CHECK_FALSE(parse_node_info(make_resp_err(3, "NO_NODE")).snr.has_value());

    CHECK(error_text(make_resp_err(4, "NO_NODE")) == "NO_NODE");
    CHECK(error_text(make_resp_err(4, "")) == "unknown");
}

TEST_CASE("describe_frame summarises frames for logs") {
    DeliveryEvent ev;
    ev.packet_id = 9;
    ev.from = 555;
    ev.snr = 7.0f;
    const std::string d = describe_frame(make_delivery_event(ev));
    CHECK(d.find("event=delivery") == 0);
    CHECK(d.find("packet_id=9") != std::string::npos);
    CHECK(d.find("from=!0000022b") != std::string::npos);
    CHECK(d.find("snr_db=7.00") != std::string::npos);

    CHECK(describe_frame(make_resp_ok(5)) == "status=ok seq=5");
    CHECK(describe_frame({0x01}) == "status=error reason=bad_frame");

    auto cut = make_delivery_event(ev);
    cut.pop_back();
    CHECK(describe_frame(cut).find("truncated=1") != std::string::npos);

    CHECK(hex_dump({0xC0, 0x01, 0xFF}) == "c0 01 ff");
}

TEST_CASE("SLIP escapes END and ESC and the decoder restores them") {
    const std::vector<uint8_t> payload = {0x01, slip::END, 0x02, slip::ESC, 0x03};
    const auto wire = slip::encode(payload);
    CHECK(wire.front() == slip::END);
    CHECK(wire.back() == slip::END);
    CHECK(wire.size() == payload.size() + 2 + 2);

    slip::Decoder dec;
    std::vector<uint8_t> frame;
    int frames = 0;
    for (uint8_t b : wire) {
        if (dec.feed(b, frame)) ++frames;
    }
    CHECK(frames == 1);
    CHECK(frame == payload);
}

TEST_CASE("SLIP decoder skips noise and drops bad escapes") {
    slip::Decoder dec;
    std::vector<uint8_t> frame;

    // Bytes before the first END are line noise.
    for (uint8_t b : {0x55, 0x66}) CHECK_FALSE(dec.feed(b, frame));

    // Bad escape: frame discarded.
    for (uint8_t b : {slip::END, uint8_t(0x01), slip::ESC, uint8_t(0x42)}) CHECK_FALSE(dec.feed(b, frame));
    CHECK(dec.dropped() == 1);

    // Recovery on the next delimited frame; back-to-back ENDs are not empty frames.
    bool got = false;
    for (uint8_t b : {slip::END, slip::END, uint8_t(0x07), slip::END}) got = dec.feed(b, frame) || got;
    CHECK(got);
    CHECK(frame == std::vector<uint8_t>{0x07});
}

TEST_CASE("SLIP decoder drops oversized frames") {
    slip::Decoder dec;
    std::vector<uint8_t> frame;
    dec.feed(slip::END, frame);
    for (size_t i = 0; i <= slip::MAX_FRAME; ++i) dec.feed(0x11, frame);
    CHECK(dec.dropped() == 1);
    CHECK_FALSE(dec.feed(slip::END, frame));
}
