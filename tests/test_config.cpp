#include <doctest/doctest.h>

#include <fstream>

#include <nlohmann/json.hpp>

#include "meshwx/config.hpp"
#include "meshwx/errors.hpp"
#include "meshwx/node_directory.hpp"
#include "test_support.hpp"

using namespace meshwx;
using nlohmann::json;
using meshwx::testing::TempDir;

TEST_CASE("an empty document yields the defaults") {
    StationConfig cfg = config_from_json(json::object(), "");
    CHECK(cfg.nodes.empty());
    CHECK(cfg.selected_node == "yang");
    CHECK(cfg.update_interval_s == 60);
    CHECK(cfg.ack_retry_timeout_s == 60);
    CHECK(cfg.max_retries == 1);
    CHECK(cfg.confirmation_delay_s == 10);
    CHECK(cfg.confirmations);
    CHECK(cfg.log_level == LogLevel::Info);
    CHECK(cfg.active_template() == DEFAULT_TEMPLATE);
}

TEST_CASE("every section is read") {
    const json doc = json::parse(R"({
        "nodes": {
            "yang": "!0000022b",
            "ying": { "id": 556, "public_key": "ab01ff" }
        },
        "settings": { "selected_node": "ying", "update_interval": 300, "channel": 1,
                      "message_template": "short", "reading_file": "/tmp/r.json" },
        "message_templates": { "short": "{temp}F {ack}" },
        "delivery": { "ack_retry_timeout": 45, "max_retries": 2, "confirmation_delay": 5,
                      "confirmations": false, "retention": 120 },
        "stats": { "file": "stats.json", "autosave_every": 1 },
        "logging": { "level": "debug", "event_log": "events.jsonl" },
        "radio": { "device": "/dev/ttyACM0", "baud": 9600, "timeout_ms": 800 }
    })");

    StationConfig cfg = config_from_json(doc, "/etc/meshwx");
    REQUIRE(cfg.nodes.size() == 2);
    CHECK(cfg.nodes[0].name == "yang");
    CHECK(cfg.nodes[0].id == 555);
    CHECK_FALSE(cfg.nodes[0].public_key.has_value());
    CHECK(cfg.nodes[1].id == 556);
    REQUIRE(cfg.nodes[1].public_key.has_value());
    CHECK(*cfg.nodes[1].public_key == std::vector<uint8_t>{0xAB, 0x01, 0xFF});

    CHECK(cfg.selected_node == "ying");
    CHECK(cfg.update_interval_s == 300);
    CHECK(cfg.channel == 1);
    CHECK(cfg.active_template() == "{temp}F {ack}");
    CHECK(cfg.templates.count("template1") == 1);
    CHECK(cfg.reading_file == "/tmp/r.json");

    CHECK(cfg.ack_retry_timeout_s == 45);
    CHECK(cfg.max_retries == 2);
    CHECK(cfg.confirmation_delay_s == 5);
    CHECK_FALSE(cfg.confirmations);
    CHECK(cfg.retention_s == 120);

    CHECK(cfg.stats_file == "/etc/meshwx/stats.json");
    CHECK(cfg.autosave_every == 1);
    CHECK(cfg.log_level == LogLevel::Debug);
    CHECK(cfg.event_log == "/etc/meshwx/events.jsonl");

    CHECK(cfg.device == "/dev/ttyACM0");
    CHECK(cfg.baud == 9600);
    CHECK(cfg.timeout_ms == 800);
}

TEST_CASE("an unknown template name falls back to template1") {
    const json doc = json::parse(R"({"settings": {"message_template": "missing"}})");
    CHECK(config_from_json(doc, "").active_template() == DEFAULT_TEMPLATE);
}

TEST_CASE("bad values are rejected with the field name") {
    auto fails_with = [](const char* text, const char* field) {
        try {
            config_from_json(json::parse(text), "");
        } catch (const ConfigError& e) {
            return std::string(e.what()).find(field) != std::string::npos;
        }
        return false;
    };

    CHECK(fails_with(R"({"settings": {"update_interval": "soon"}})", "settings.update_interval"));
    CHECK(fails_with(R"({"settings": {"update_interval": 0}})", "settings.update_interval"));
    CHECK(fails_with(R"({"settings": {"channel": 300}})", "settings.channel"));
    CHECK(fails_with(R"({"delivery": {"max_retries": -1}})", "delivery.max_retries"));
    CHECK(fails_with(R"({"delivery": {"confirmations": "yes"}})", "delivery.confirmations"));
    CHECK(fails_with(R"({"logging": {"level": "loud"}})", "logging.level"));
    CHECK(fails_with(R"({"nodes": {"yang": "not-an-id"}})", "nodes.yang"));
    CHECK(fails_with(R"({"nodes": {"yang": {"id": 1, "public_key": "xyz"}}})", "nodes.yang.public_key"));
    CHECK(fails_with(R"({"nodes": {"a": 7, "b": 7}})", "nodes.b"));
    CHECK(fails_with(R"({"radio": []})", "radio"));
}

TEST_CASE("load_config: missing file gives defaults, broken file is a ConfigError") {
    TempDir dir;
    StationConfig cfg = load_config(dir.file("none.json"));
    CHECK(cfg.nodes.empty());
    CHECK(cfg.active_template() == DEFAULT_TEMPLATE);

    const std::string path = dir.file("config.json");
    {
        std::ofstream out(path);
        out << R"({"nodes": {"yang": 555}, "stats": {"file": "s.json"}})";
    }
    cfg = load_config(path);
    REQUIRE(cfg.nodes.size() == 1);
    CHECK(cfg.stats_file == dir.file("s.json"));

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ nodes: ";
    }
    CHECK_THROWS_AS(load_config(path), ConfigError);
}

TEST_CASE("node ids parse in mesh, hex and decimal notation") {
    uint32_t id = 0;
    CHECK(parse_node_id("!a1b2c3d4", id));
    CHECK(id == 0xa1b2c3d4u);
    CHECK(parse_node_id("0x22B", id));
    CHECK(id == 555);
    CHECK(parse_node_id("556", id));
    CHECK(id == 556);

    CHECK_FALSE(parse_node_id("", id));
    CHECK_FALSE(parse_node_id("!", id));
    CHECK_FALSE(parse_node_id("!12345678ff", id));
    CHECK_FALSE(parse_node_id("12a", id));
    CHECK_FALSE(parse_node_id("-5", id));

    CHECK(format_node_id(555) == "!0000022b");
}

TEST_CASE("targets: every other node from a configured station, else the selected one") {
    NodeDirectory dir({{"yang", 555, std::nullopt}, {"ying", 556, std::nullopt}, {"base", 557, std::nullopt}});

    auto from_yang = dir.targets_for(555, "ying");
    REQUIRE(from_yang.size() == 2);
    CHECK(from_yang[0] == "ying");
    CHECK(from_yang[1] == "base");

    auto from_outside = dir.targets_for(0x999, "ying");
    REQUIRE(from_outside.size() == 1);
    CHECK(from_outside[0] == "ying");

    CHECK_THROWS_AS(dir.targets_for(0x999, "nobody"), NotFoundError);
    CHECK(dir.contains("base"));
    CHECK(dir.find_by_id(556)->name == "ying");
    CHECK(dir.find_by_id(1) == nullptr);
}
