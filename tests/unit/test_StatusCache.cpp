#include <catch2/catch_test_macros.hpp>

#include "infrastructure/monitoring/StatusCache.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace vikabh::core;
using namespace vikabh::infra;

namespace {

StatusEntry makeEntry(int64_t deviceId, ProbeOutcome outcome, bool persisted = true,
                      std::chrono::system_clock::time_point at = std::chrono::system_clock::now()) {
    StatusEntry entry;
    entry.result.deviceId = deviceId;
    entry.result.timestamp = at;
    entry.result.outcome = outcome;
    if (outcome == ProbeOutcome::Online) {
        entry.result.latency = std::chrono::microseconds(1500);
    }
    entry.persisted = persisted;
    return entry;
}

} // namespace

TEST_CASE("StatusCache get and set", "[StatusCache]") {
    StatusCache cache;

    SECTION("Unknown device has no entry") {
        REQUIRE_FALSE(cache.get(42).has_value());
        REQUIRE(cache.size() == 0);
    }

    SECTION("Set then get returns the same entry") {
        auto entry = makeEntry(1, ProbeOutcome::Online);
        cache.set(entry);

        auto stored = cache.get(1);
        REQUIRE(stored.has_value());
        REQUIRE(*stored == entry);
        REQUIRE(stored->result.latencyMs().value() == 1.5);
    }

    SECTION("A newer result replaces the previous one") {
        cache.set(makeEntry(1, ProbeOutcome::Online));
        cache.set(makeEntry(1, ProbeOutcome::Offline));

        REQUIRE(cache.size() == 1);
        REQUIRE(cache.get(1)->result.outcome == ProbeOutcome::Offline);
    }
}

TEST_CASE("StatusCache snapshot and retain", "[StatusCache]") {
    StatusCache cache;
    cache.set(makeEntry(3, ProbeOutcome::Error));
    cache.set(makeEntry(1, ProbeOutcome::Online));
    cache.set(makeEntry(2, ProbeOutcome::Offline));

    SECTION("Snapshot is ordered by device id") {
        auto snapshot = cache.snapshot();
        REQUIRE(snapshot.size() == 3);
        REQUIRE(snapshot[0].deviceId() == 1);
        REQUIRE(snapshot[1].deviceId() == 2);
        REQUIRE(snapshot[2].deviceId() == 3);
    }

    SECTION("Snapshot is a copy") {
        auto snapshot = cache.snapshot();
        cache.clear();
        REQUIRE(snapshot.size() == 3);
        REQUIRE(cache.size() == 0);
    }

    SECTION("Retain drops devices outside the set") {
        REQUIRE(cache.retain({1, 3}) == 1);
        REQUIRE(cache.get(1).has_value());
        REQUIRE_FALSE(cache.get(2).has_value());
        REQUIRE(cache.get(3).has_value());
    }

    SECTION("Retain with an empty set clears everything") {
        REQUIRE(cache.retain({}) == 3);
        REQUIRE(cache.size() == 0);
    }
}

TEST_CASE("StatusCache summary", "[StatusCache]") {
    StatusCache cache;

    SECTION("Empty cache") {
        auto summary = cache.summary();
        REQUIRE(summary.total() == 0);
        REQUIRE_FALSE(summary.lastUpdate.has_value());
    }

    SECTION("Counts outcomes, stale entries and the latest timestamp") {
        auto base = std::chrono::system_clock::now();
        cache.set(makeEntry(1, ProbeOutcome::Online, true, base));
        cache.set(makeEntry(2, ProbeOutcome::Online, true, base + std::chrono::seconds(2)));
        cache.set(makeEntry(3, ProbeOutcome::Offline, false, base + std::chrono::seconds(1)));
        cache.set(makeEntry(4, ProbeOutcome::Error, true, base));

        auto summary = cache.summary();
        REQUIRE(summary.online == 2);
        REQUIRE(summary.offline == 1);
        REQUIRE(summary.error == 1);
        REQUIRE(summary.stale == 1);
        REQUIRE(summary.total() == 4);
        REQUIRE(summary.lastUpdate == base + std::chrono::seconds(2));
    }
}

TEST_CASE("StatusCache concurrent readers and writer", "[StatusCache]") {
    StatusCache cache;
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            while (!done) {
                for (const auto& entry : cache.snapshot()) {
                    // Online entries always carry a latency, others never do
                    if (entry.result.isOnline() != entry.result.latency.has_value()) {
                        ++torn;
                    }
                }
            }
        });
    }

    for (int i = 0; i < 2000; ++i) {
        cache.set(makeEntry(i % 16, i % 2 == 0 ? ProbeOutcome::Online : ProbeOutcome::Offline));
    }
    done = true;
    for (auto& reader : readers) {
        reader.join();
    }

    REQUIRE(torn.load() == 0);
    REQUIRE(cache.size() == 16);
}
