#include <drogon/drogon_test.h>
#include <drogon/drogon.h>
#include "../utils/EphemeralCache.h"

#include <thread>

using namespace std::chrono;

namespace {

struct FakeClock {
    steady_clock::time_point now = steady_clock::time_point(seconds(1000));
    EphemeralCache::Clock fn() {
        return [this]() { return now; };
    }
};

}

DROGON_TEST(EphemeralCache_ExpiresAfterTtl)
{
    FakeClock clock;
    EphemeralCache cache(milliseconds(1000), minutes(5), clock.fn());

    Json::Value value(Json::objectValue);
    value["title"] = "a";
    cache.set("https://example.com", value);

    clock.now += milliseconds(500);
    auto hit = cache.get("https://example.com");
    REQUIRE(hit.has_value());
    CHECK((*hit)["title"].asString() == "a");

    clock.now += milliseconds(1000);
    CHECK(!cache.get("https://example.com").has_value());
    CHECK(cache.size() == 0);
}

DROGON_TEST(EphemeralCache_CustomTtlAndRefresh)
{
    FakeClock clock;
    EphemeralCache cache(milliseconds(1000), minutes(5), clock.fn());

    cache.set("k", Json::Value("v"), milliseconds(5000));
    clock.now += milliseconds(2000);
    CHECK(cache.has("k"));
    auto left = cache.ttl("k");
    REQUIRE(left.has_value());
    CHECK(left->count() == 3000);

    CHECK(cache.refresh("k"));
    clock.now += milliseconds(900);
    CHECK(cache.has("k"));
    clock.now += milliseconds(200);
    CHECK(!cache.has("k"));
    CHECK(!cache.refresh("k"));
}

DROGON_TEST(EphemeralCache_CleanupRemovesOnlyExpired)
{
    FakeClock clock;
    EphemeralCache cache(milliseconds(1000), minutes(5), clock.fn());

    cache.set("short", Json::Value(1));
    cache.set("long", Json::Value(2), milliseconds(10000));
    clock.now += milliseconds(1500);

    CHECK(cache.cleanup() == 1);
    CHECK(cache.size() == 1);
    CHECK(cache.keys().front() == "long");

    CHECK(cache.erase("long"));
    CHECK(!cache.erase("long"));
    CHECK(cache.size() == 0);
}

DROGON_TEST(EphemeralCache_NoSweepWithoutLoop)
{
    EphemeralCache cache;
    cache.set("k", Json::Value(1));
    CHECK(!cache.sweepActive());
    cache.clear();
    CHECK(cache.size() == 0);
}

DROGON_TEST(EphemeralCache_SweepStopsWhenEmptyAndRestartsOnWrite)
{
    EphemeralCache cache(milliseconds(20), milliseconds(50));
    cache.attachLoop(drogon::app().getLoop());
    CHECK(!cache.sweepActive());

    cache.set("k", Json::Value(1));
    CHECK(cache.sweepActive());

    // 条目过期后由周期清理移除，缓存为空时定时器停止
    const auto deadline = steady_clock::now() + seconds(3);
    while (cache.sweepActive() && steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    CHECK(!cache.sweepActive());
    CHECK(cache.size() == 0);

    cache.set("k2", Json::Value(2));
    CHECK(cache.sweepActive());

    cache.attachLoop(nullptr);
    CHECK(!cache.sweepActive());
    // 等待定时器注销在事件循环上生效
    std::this_thread::sleep_for(milliseconds(100));
}
