#include <doctest/doctest.h>

#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "meshwx/log.hpp"
#include "radio_discovery.hpp"
#include "test_support.hpp"

using namespace meshwx;
using meshwx::testing::TempDir;

namespace {

std::vector<RadioInfo> two_radios() {
    RadioInfo heard;
    heard.dev_path = "/dev/ttyACM0";
    heard.by_id    = "/dev/serial/by-id/usb-RAK_WisBlock-if00";
    heard.node_num = 0x0a1b2c3d;

    RadioInfo silent;
    silent.dev_path = "/dev/ttyUSB1";
    return {heard, silent};
}

} // namespace

TEST_CASE("the roster is a JSON array, one object per radio") {
    TempDir dir;
    Logger log(LogLevel::Error);
    const auto state_dir = (dir.path() / "state").string();   // created on demand

    REQUIRE(save_roster(two_radios(), state_dir, log));

    nlohmann::json doc;
    std::ifstream in(state_dir + "/radios.json");
    REQUIRE(in.good());
    in >> doc;
    REQUIRE(doc.is_array());
    REQUIRE(doc.size() == 2);

    CHECK(doc[0]["dev_path"] == "/dev/ttyACM0");
    CHECK(doc[0]["by_id"] == "/dev/serial/by-id/usb-RAK_WisBlock-if00");
    CHECK(doc[0]["online"] == true);
    CHECK(doc[0]["node_num"] == 0x0a1b2c3d);
    CHECK(doc[0]["node_id"] == "!0a1b2c3d");

    CHECK(doc[1]["dev_path"] == "/dev/ttyUSB1");
    CHECK(doc[1]["by_id"] == "");
    CHECK(doc[1]["online"] == false);
    CHECK(doc[1]["node_num"].is_null());
    CHECK_FALSE(doc[1].contains("node_id"));
}

TEST_CASE("an empty scan still writes an empty roster") {
    TempDir dir;
    Logger log(LogLevel::Error);
    REQUIRE(save_roster({}, dir.path().string(), log));

    nlohmann::json doc;
    std::ifstream in(dir.file("radios.json"));
    in >> doc;
    CHECK(doc == nlohmann::json::array());
}

TEST_CASE("an unwritable state directory fails without throwing") {
    TempDir dir;
    Logger log(LogLevel::Error);
    const std::string blocker = dir.file("not-a-dir");
    std::ofstream(blocker) << "x";

    CHECK_FALSE(save_roster(two_radios(), blocker + "/state", log));
}

TEST_CASE("first_online skips radios that did not answer") {
    auto radios = two_radios();
    std::swap(radios[0], radios[1]);
    auto pick = first_online(radios);
    REQUIRE(pick.has_value());
    CHECK(pick->dev_path == "/dev/ttyACM0");

    radios[1].node_num.reset();
    CHECK_FALSE(first_online(radios).has_value());
}

TEST_CASE("candidates name a device and only by-id links carry by_id") {
    for (const auto& r : list_serial_candidates()) {
        CHECK(r.dev_path.rfind("/dev/", 0) == 0);
        CHECK_FALSE(r.online());
        if (!r.by_id.empty()) CHECK(r.by_id.rfind("/dev/serial/by-id/", 0) == 0);
    }
}
