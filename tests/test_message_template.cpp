#include <doctest/doctest.h>

#include <fstream>

#include "meshwx/clock.hpp"
#include "meshwx/config.hpp"
#include "meshwx/message_template.hpp"
#include "test_support.hpp"

using namespace meshwx;
using meshwx::testing::TempDir;

TEST_CASE("placeholders are substituted; unknown ones and escapes survive") {
    TemplateFields f{{"temp", "71"}, {"ack", "ACK"}};
    CHECK(render_template("T: {temp}F [{ack}]", f) == "T: 71F [ACK]");
    CHECK(render_template("{nope} {temp}", f) == "{nope} 71");
    CHECK(render_template("{{temp}} {temp}", f) == "{temp} 71");
    CHECK(render_template("open { brace", f) == "open { brace");
    CHECK(render_template("", f).empty());
}

TEST_CASE("telemetry fields from a full set of inputs") {
    TelemetryInputs in;
    in.now_ms = 1700000000000ull;
    in.reading = SensorReading{71.9, 40.6};
    in.online = 2;
    in.total = 3;
    in.snr = 7.0f;
    in.hops = 1;
    in.ack = "ACK";

    auto f = telemetry_fields(in);
    CHECK(f["temp"] == "71");
    CHECK(f["humidity"] == "40");
    CHECK(f["online"] == "2");
    CHECK(f["total"] == "3");
    CHECK(f["snr"] == "7.0");
    CHECK(f["hops"] == "1");
    CHECK(f["ack"] == "ACK");
    CHECK(f["date"] == format_local_time(in.now_ms, "%m/%d"));
    CHECK(f["time"] == format_local_time(in.now_ms, "%H:%M"));
    CHECK(f["time_detail"] == format_local_time(in.now_ms, "%H:%M:%S"));

    const std::string text = render_template(DEFAULT_TEMPLATE, f);
    CHECK(text.find("(2/3)") != std::string::npos);
    CHECK(text.find("T: 71F 7.0 snr/1 hop") != std::string::npos);
    CHECK(text.find("H: 40% ") != std::string::npos);
}

TEST_CASE("missing readings and half-known links render as placeholders") {
    TelemetryInputs in;
    in.snr = 3.0f;   // hops unknown: neither is shown

    auto f = telemetry_fields(in);
    CHECK(f["temp"] == "--");
    CHECK(f["humidity"] == "--");
    CHECK(f["snr"] == "--");
    CHECK(f["hops"] == "--");
    CHECK(f["ack"] == "--");
}

TEST_CASE("sensor readings load from JSON in either unit") {
    TempDir dir;
    SensorReading r;
    std::string err;

    CHECK_FALSE(read_sensor_reading(dir.file("absent.json"), r, err));
    CHECK(err == "missing");

    const std::string path = dir.file("reading.json");
    {
        std::ofstream out(path);
        out << R"({"temperature_f": 68.5, "humidity": 51})";
    }
    REQUIRE(read_sensor_reading(path, r, err));
    CHECK(r.temperature_f == doctest::Approx(68.5));
    CHECK(r.humidity == doctest::Approx(51.0));

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"temperature_c": 20, "humidity": 30})";
    }
    REQUIRE(read_sensor_reading(path, r, err));
    CHECK(r.temperature_f == doctest::Approx(68.0));

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"temperature_f": "warm", "humidity": 30})";
    }
    CHECK_FALSE(read_sensor_reading(path, r, err));

    {
        std::ofstream out(path, std::ios::trunc);
        out << "not json";
    }
    CHECK_FALSE(read_sensor_reading(path, r, err));
    CHECK_FALSE(err.empty());
}
