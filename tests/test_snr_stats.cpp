#include <doctest/doctest.h>

#include <cmath>
#include <fstream>
#include <limits>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "meshwx/snr_stats.hpp"
#include "test_support.hpp"

using namespace meshwx;
using meshwx::testing::TempDir;

TEST_CASE("samples keep min <= average <= max") {
    Logger log(LogLevel::Error);
    SnrStatsStore store("", 0, log);

    const float samples[] = {-7.25f, 3.5f, 12.0f, -1.0f, 0.1f};
    uint64_t t = 1000;
    for (float s : samples) store.record_sample("yang", s, t += 1000);

    auto r = store.snapshot("yang");
    REQUIRE(r.has_value());
    CHECK(r->count == 5);
    CHECK(r->min_snr == doctest::Approx(-7.25f));
    CHECK(r->max_snr == doctest::Approx(12.0f));
    CHECK(r->first_seen_ms == 2000u);
    CHECK(r->last_seen_ms == 6000u);
    REQUIRE(r->average().has_value());
    CHECK(*r->average() >= r->min_snr);
    CHECK(*r->average() <= r->max_snr);
    CHECK(*r->average() == doctest::Approx((-7.25 + 3.5 + 12.0 - 1.0 + 0.1) / 5.0));
}

TEST_CASE("the recent ring holds the newest ten samples in arrival order") {
    Logger log(LogLevel::Error);
    SnrStatsStore store("", 0, log);
    for (int i = 1; i <= 13; ++i) store.record_sample("ying", static_cast<float>(i), i);

    auto recent = store.snapshot("ying")->recent_samples();
    REQUIRE(recent.size() == SnrRecord::RECENT_CAPACITY);
    CHECK(recent.front() == doctest::Approx(4.0f));
    CHECK(recent.back() == doctest::Approx(13.0f));
    CHECK(store.snapshot("ying")->count == 13);
}

TEST_CASE("non-finite samples are dropped") {
    Logger log(LogLevel::Error);
    SnrStatsStore store("", 0, log);
    store.record_sample("yang", std::numeric_limits<float>::quiet_NaN(), 1);
    store.record_sample("yang", std::numeric_limits<float>::infinity(), 2);
    CHECK_FALSE(store.snapshot("yang").has_value());
}

TEST_CASE("a node never heard has no record and no average") {
    Logger log(LogLevel::Error);
    SnrStatsStore store("", 0, log);
    CHECK_FALSE(store.snapshot("nobody").has_value());
    CHECK_FALSE(SnrRecord{}.average().has_value());
}

TEST_CASE("flush and load reproduce the same records") {
    TempDir dir;
    Logger log(LogLevel::Error);
    const std::string path = dir.file("snr_stats.json");

    {
        SnrStatsStore store(path, 0, log);
        store.record_sample("yang", 7.0f, 1000);
        store.record_sample("yang", -2.5f, 2000);
        store.record_sample("ying", 11.25f, 3000);
        REQUIRE(store.flush());
    }

    SnrStatsStore again(path, 0, log);
    REQUIRE(again.load());
    auto all = again.snapshot_all();
    REQUIRE(all.size() == 2);

    const SnrRecord& yang = all.at("yang");
    CHECK(yang.count == 2);
    CHECK(yang.min_snr == -2.5f);
    CHECK(yang.max_snr == 7.0f);
    CHECK(yang.sum == 4.5);
    CHECK(yang.first_seen_ms == 1000u);
    CHECK(yang.last_seen_ms == 2000u);
    REQUIRE(yang.recent_samples().size() == 2);
    CHECK(yang.recent_samples()[0] == 7.0f);
    CHECK(yang.recent_samples()[1] == -2.5f);

    CHECK(all.at("ying").max_snr == 11.25f);
}

TEST_CASE("a missing file loads as empty") {
    TempDir dir;
    Logger log(LogLevel::Error);
    SnrStatsStore store(dir.file("absent.json"), 0, log);
    CHECK(store.load());
    CHECK(store.snapshot_all().empty());
}

TEST_CASE("a malformed file fails to load and leaves the store untouched") {
    TempDir dir;
    Logger log(LogLevel::Error);
    const std::string path = dir.file("snr_stats.json");
    {
        std::ofstream out(path);
        out << "{ \"nodes\": { \"yang\": { \"min_snr\": 1 ";
    }

    SnrStatsStore store(path, 0, log);
    store.record_sample("ying", 2.0f, 1);
    CHECK_FALSE(store.load());
    CHECK(store.snapshot("ying").has_value());

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"version":1,"nodes":{"yang":{"min_snr":5,"max_snr":1,"sum":6,"count":2,)"
               R"("first_seen":1,"last_seen":2,"recent":[5,1]}}})";
    }
    CHECK_FALSE(store.load());
}

TEST_CASE("reset needs both the acknowledgement and the typed phrase") {
    TempDir dir;
    Logger log(LogLevel::Error);
    const std::string path = dir.file("snr_stats.json");
    SnrStatsStore store(path, 0, log);
    store.record_sample("yang", 4.0f, 10);

    CHECK_FALSE(store.reset_all({false, "RESET"}));
    CHECK_FALSE(store.reset_all({true, "reset"}));
    CHECK_FALSE(store.reset_all({true, ""}));
    CHECK(store.snapshot("yang")->count == 1);

    CHECK(store.reset_all({true, RESET_PHRASE}));
    auto r = store.snapshot("yang");
    REQUIRE(r.has_value());
    CHECK(r->count == 0);
    CHECK(r->recent_samples().empty());
    CHECK_FALSE(r->average().has_value());

    // The empty state reached the disk.
    nlohmann::json doc;
    std::ifstream in(path);
    in >> doc;
    CHECK(doc["nodes"]["yang"]["count"] == 0);
}

TEST_CASE("recording samples never writes the file; flush_if_due does once enough are waiting") {
    TempDir dir;
    Logger log(LogLevel::Error);
    const std::string path = dir.file("snr_stats.json");
    SnrStatsStore store(path, 3, log);

    store.record_sample("yang", 1.0f, 1);
    store.record_sample("yang", 2.0f, 2);
    CHECK_FALSE(store.save_due());
    CHECK(store.flush_if_due());
    CHECK_FALSE(std::ifstream(path).good());

    store.record_sample("yang", 3.0f, 3);
    store.record_sample("yang", 4.0f, 4);
    CHECK(store.save_due());
    CHECK_FALSE(std::ifstream(path).good());

    REQUIRE(store.flush_if_due());
    CHECK_FALSE(store.save_due());
    nlohmann::json doc;
    std::ifstream in(path);
    in >> doc;
    CHECK(doc["version"] == 1);
    CHECK(doc["nodes"]["yang"]["count"] == 4);
}

TEST_CASE("autosave zero leaves saving to an explicit flush") {
    TempDir dir;
    Logger log(LogLevel::Error);
    const std::string path = dir.file("snr_stats.json");
    SnrStatsStore store(path, 0, log);

    for (int i = 0; i < 20; ++i) store.record_sample("yang", 5.0f, uint64_t(i));
    CHECK_FALSE(store.save_due());
    CHECK(store.flush_if_due());
    CHECK_FALSE(std::ifstream(path).good());

    REQUIRE(store.flush());
    CHECK(std::ifstream(path).good());
}

TEST_CASE("concurrent flushes leave the newest records on disk") {
    TempDir dir;
    Logger log(LogLevel::Error);
    const std::string path = dir.file("snr_stats.json");
    SnrStatsStore store(path, 0, log);

    constexpr int kThreads = 4;
    constexpr int kRounds = 25;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&store, t] {
            for (int i = 0; i < kRounds; ++i) {
                store.record_sample("yang", float(t + i % 3), uint64_t(i));
                store.flush();
            }
        });
    }
    for (auto& w : workers) w.join();

    nlohmann::json doc;
    std::ifstream in(path);
    in >> doc;
    CHECK(doc["nodes"]["yang"]["count"] == kThreads * kRounds);
}
