#define BOOST_TEST_MODULE Suites
#include <boost/test/unit_test.hpp>

#include <stdlib.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "Loading.hpp"

using namespace std::chrono_literals;

// time moves only when test says so
struct ManualClock
{
    using duration                  = std::chrono::milliseconds;
    using rep                       = duration::rep;
    using period                    = duration::period;
    using time_point                = std::chrono::time_point<ManualClock>;
    static constexpr bool is_steady = true;

    static inline std::atomic<rep> sNow{0};

    static time_point now() { return time_point(duration(sNow.load())); }
    static void       advance(duration aStep) { sNow += aStep.count(); }
    static void       reset() { sNow = 0; }
};

using Config      = Cache::Loading::Config;
using IntCache    = Cache::Loading::Manager<int, int>;
using ManualCache = Cache::Loading::Manager<int, int, ManualClock>;

BOOST_AUTO_TEST_SUITE(Loading)
BOOST_AUTO_TEST_CASE(memoize)
{
    std::atomic<int>                          sCalls{0};
    Cache::Loading::Manager<int, std::string> sCache([&](int aKey) {
        sCalls++;
        return std::to_string(aKey * 2);
    });

    BOOST_CHECK_EQUAL(sCache.Get(21), "42");
    BOOST_CHECK_EQUAL(sCache.Get(21), "42");
    BOOST_CHECK_EQUAL(sCalls.load(), 1);

    BOOST_CHECK_EQUAL(sCache.Get(1), "2");
    BOOST_CHECK_EQUAL(sCalls.load(), 2);
    BOOST_CHECK_EQUAL(sCache.Size(), 2);
}
BOOST_AUTO_TEST_CASE(null_value)
{
    std::atomic<int> sCalls{0};
    Cache::Loading::Manager<std::string, std::shared_ptr<std::string>> sCache([&](const std::string& aKey) -> std::shared_ptr<std::string> {
        sCalls++;
        if (aKey == "missing")
            return nullptr;
        return std::make_shared<std::string>(aKey);
    });

    BOOST_CHECK(sCache.Get("missing") == nullptr);
    BOOST_CHECK(sCache.Get("missing") == nullptr);
    BOOST_CHECK_EQUAL(sCalls.load(), 1);
    BOOST_CHECK_EQUAL(*sCache.Get("present"), "present");
    BOOST_CHECK_EQUAL(sCalls.load(), 2);

    Cache::Loading::Manager<int, std::optional<int>> sOptional([&](int) -> std::optional<int> {
        sCalls++;
        return std::nullopt;
    });
    BOOST_CHECK(!sOptional.Get(3).has_value());
    BOOST_CHECK(!sOptional.Get(3).has_value());
    BOOST_CHECK_EQUAL(sCalls.load(), 3);
}
BOOST_AUTO_TEST_CASE(set)
{
    std::atomic<int> sCalls{0};
    IntCache         sCache([&](int aKey) {
        sCalls++;
        return aKey;
    });

    sCache.Set(5, 50);
    BOOST_CHECK_EQUAL(sCache.Get(5), 50);
    BOOST_CHECK_EQUAL(sCalls.load(), 0);

    BOOST_CHECK_EQUAL(sCache.Get(6), 6);
    sCache.Set(6, 60);
    BOOST_CHECK_EQUAL(sCache.Get(6), 60);
    BOOST_CHECK_EQUAL(sCalls.load(), 1);
    BOOST_CHECK_EQUAL(sCache.Size(), 2);
}
BOOST_AUTO_TEST_CASE(age_order)
{
    IntCache sCache([](int aKey) { return aKey; });
    sCache.Get(1);
    sCache.Get(2);
    sCache.Get(3);
    sCache.Set(1, 10);

    std::vector<int> sKeys;
    sCache.Debug([&sKeys](int aKey, const auto& aEntry) {
        BOOST_TEST_MESSAGE("key " << aKey << " value " << aEntry.value);
        BOOST_CHECK(aEntry.computed.load());
        sKeys.push_back(aKey);
    });
    const std::vector<int> sExpected{2, 3, 1};
    BOOST_CHECK_EQUAL_COLLECTIONS(sKeys.begin(), sKeys.end(), sExpected.begin(), sExpected.end());
}
BOOST_AUTO_TEST_CASE(single_computation)
{
    const int        THREADS = 16;
    std::atomic<int> sCalls{0};

    Cache::Loading::Manager<int, std::shared_ptr<int>> sCache([&](int aKey) {
        sCalls++;
        std::this_thread::sleep_for(50ms);
        return std::make_shared<int>(aKey);
    });

    std::promise<void> sStart;
    auto               sGo = sStart.get_future().share();

    std::vector<std::future<std::shared_ptr<int>>> sResults;
    for (int i = 0; i < THREADS; i++)
        sResults.push_back(std::async(std::launch::async, [&sCache, sGo]() {
            sGo.wait();
            return sCache.Get(7);
        }));
    sStart.set_value();

    std::vector<std::shared_ptr<int>> sValues;
    for (auto& x : sResults)
        sValues.push_back(x.get());

    BOOST_CHECK_EQUAL(sCalls.load(), 1);
    for (auto& x : sValues) {
        BOOST_REQUIRE(x);
        BOOST_CHECK_EQUAL(*x, 7);
        BOOST_CHECK(x == sValues.front());
    }
}
BOOST_AUTO_TEST_CASE(compute_failure)
{
    int      sCalls = 0;
    IntCache sCache([&](int aKey) {
        if (sCalls++ == 0)
            throw std::runtime_error("backend unavailable");
        return aKey * 10;
    });

    BOOST_CHECK_THROW(sCache.Get(1), std::runtime_error);
    BOOST_CHECK_EQUAL(sCache.Size(), 1);

    // retried on next request
    BOOST_CHECK_EQUAL(sCache.Get(1), 10);
    BOOST_CHECK_EQUAL(sCache.Get(1), 10);
    BOOST_CHECK_EQUAL(sCalls, 2);
}
BOOST_AUTO_TEST_CASE(compute_failure_concurrent)
{
    const int        THREADS = 8;
    std::atomic<int> sCalls{0};

    IntCache sCache([&](int aKey) {
        const int sCall = sCalls++;
        std::this_thread::sleep_for(50ms);
        if (sCall == 0)
            throw std::runtime_error("backend unavailable");
        return aKey * 10;
    });

    std::promise<void> sStart;
    auto               sGo = sStart.get_future().share();

    std::vector<std::future<int>> sResults;
    for (int i = 0; i < THREADS; i++)
        sResults.push_back(std::async(std::launch::async, [&sCache, sGo]() {
            sGo.wait();
            return sCache.Get(3);
        }));
    sStart.set_value();

    int sFailed = 0;
    for (auto& x : sResults) {
        try {
            BOOST_CHECK_EQUAL(x.get(), 30);
        } catch (const std::runtime_error&) {
            sFailed++;
        }
    }

    // one waiter takes over after failure, the rest read its value
    BOOST_CHECK_EQUAL(sFailed, 1);
    BOOST_CHECK_EQUAL(sCalls.load(), 2);
    BOOST_CHECK_EQUAL(sCache.Get(3), 30);
    BOOST_CHECK_EQUAL(sCalls.load(), 2);
}
BOOST_AUTO_TEST_CASE(non_interference)
{
    std::atomic<bool> sSlowStarted{false};
    std::atomic<bool> sSlowDone{false};

    IntCache sCache([&](int aKey) {
        if (aKey == 0) {
            sSlowStarted = true;
            std::this_thread::sleep_for(500ms);
            sSlowDone = true;
        }
        return aKey;
    });

    auto sSlow = std::async(std::launch::async, [&sCache]() { return sCache.Get(0); });
    while (!sSlowStarted)
        std::this_thread::sleep_for(1ms);

    std::vector<std::future<int>> sFast;
    for (int i = 1; i <= 8; i++)
        sFast.push_back(std::async(std::launch::async, [&sCache, i]() { return sCache.Get(i); }));
    for (int i = 1; i <= 8; i++)
        BOOST_CHECK_EQUAL(sFast[i - 1].get(), i);

    BOOST_CHECK(!sSlowDone);
    BOOST_CHECK_EQUAL(sSlow.get(), 0);
    BOOST_CHECK(sSlowDone);
}
BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Expiration)
BOOST_AUTO_TEST_CASE(boundary)
{
    ManualClock::reset();
    int         sCalls = 0;
    ManualCache sCache([&](int aKey) { sCalls++; return aKey; }, Config{.expiration = 100ms, .purge_interval = 1h});

    sCache.Get(1);
    ManualClock::advance(99ms);
    BOOST_CHECK_EQUAL(sCache.Purge(), 0);
    sCache.Get(1);
    BOOST_CHECK_EQUAL(sCalls, 1);

    ManualClock::advance(1ms);
    BOOST_CHECK_EQUAL(sCache.Purge(), 1);
    BOOST_CHECK_EQUAL(sCache.Size(), 0);
    sCache.Get(1);
    BOOST_CHECK_EQUAL(sCalls, 2);
}
BOOST_AUTO_TEST_CASE(prefix)
{
    ManualClock::reset();
    ManualCache sCache([](int aKey) { return aKey; }, Config{.expiration = 100ms, .purge_interval = 1h});

    sCache.Get(1);
    ManualClock::advance(10ms);
    sCache.Get(2);
    sCache.Get(3);

    ManualClock::advance(90ms);
    BOOST_CHECK_EQUAL(sCache.Purge(), 1);
    BOOST_CHECK_EQUAL(sCache.Size(), 2);

    ManualClock::advance(10ms);
    BOOST_CHECK_EQUAL(sCache.Purge(), 2);
    BOOST_CHECK_EQUAL(sCache.Size(), 0);
}
BOOST_AUTO_TEST_CASE(set_resets_clock)
{
    ManualClock::reset();
    int         sCalls = 0;
    ManualCache sCache([&](int aKey) { sCalls++; return aKey; }, Config{.expiration = 100ms, .purge_interval = 1h});

    sCache.Get(1);
    ManualClock::advance(50ms);
    sCache.Set(1, 5);

    ManualClock::advance(50ms);
    BOOST_CHECK_EQUAL(sCache.Purge(), 0);
    BOOST_CHECK_EQUAL(sCache.Get(1), 5);

    ManualClock::advance(50ms);
    BOOST_CHECK_EQUAL(sCache.Purge(), 1);
    BOOST_CHECK_EQUAL(sCache.Get(1), 1);
    BOOST_CHECK_EQUAL(sCalls, 2);
}
BOOST_AUTO_TEST_CASE(never)
{
    IntCache sCache([](int aKey) { return aKey; });
    sCache.Get(1);
    sCache.Set(2, 2);
    std::this_thread::sleep_for(50ms);
    BOOST_CHECK_EQUAL(sCache.Purge(), 0);
    BOOST_CHECK_EQUAL(sCache.Size(), 2);
}
BOOST_AUTO_TEST_CASE(sweeper)
{
    std::atomic<int> sCalls{0};
    IntCache         sCache([&](int aKey) { sCalls++; return aKey; }, Config{.expiration = 50ms, .purge_interval = 20ms, .name = "sweep-test"});

    sCache.Get(1);
    BOOST_CHECK_EQUAL(sCache.Size(), 1);

    const auto sDeadline = std::chrono::steady_clock::now() + 2s;
    while (sCache.Size() > 0 and std::chrono::steady_clock::now() < sDeadline)
        std::this_thread::sleep_for(10ms);

    BOOST_CHECK_EQUAL(sCache.Size(), 0);
    sCache.Get(1);
    BOOST_CHECK_EQUAL(sCalls.load(), 2);
}
BOOST_AUTO_TEST_CASE(shutdown)
{
    std::atomic<int> sCalls{0};
    IntCache         sCache([&](int aKey) { sCalls++; return aKey; }, Config{.expiration = 30ms, .purge_interval = 10ms});

    std::atomic<bool>              sStop{false};
    std::vector<std::future<void>> sWorkers;
    for (int t = 0; t < 4; t++)
        sWorkers.push_back(std::async(std::launch::async, [&sCache, &sStop, t]() {
            for (int i = 0; !sStop; i++) {
                if (i % 5 == 0)
                    sCache.Set(i % 100, t);
                else
                    sCache.Get(i % 100);
            }
        }));
    auto sConcurrent = std::async(std::launch::async, [&sCache]() { sCache.Shutdown(); });

    std::this_thread::sleep_for(50ms);
    sCache.Shutdown();
    sCache.Shutdown();
    sConcurrent.get();
    sStop = true;
    for (auto& x : sWorkers)
        x.get();

    // let sweeper notice shutdown
    std::this_thread::sleep_for(150ms);

    sCache.Set(1000, -1);
    std::this_thread::sleep_for(200ms);
    const int sBefore = sCalls.load();
    BOOST_CHECK_EQUAL(sCache.Get(1000), -1);
    BOOST_CHECK_EQUAL(sCalls.load(), sBefore);

    // explicit purge still works
    BOOST_CHECK_GT(sCache.Purge(), 0u);
    BOOST_CHECK_EQUAL(sCache.Get(1000), 1000);
    BOOST_CHECK_EQUAL(sCalls.load(), sBefore + 1);
}
BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Configuration)
BOOST_AUTO_TEST_CASE(duration)
{
    BOOST_CHECK(Util::parseDuration("250") == 250ms);
    BOOST_CHECK(Util::parseDuration("250ms") == 250ms);
    BOOST_CHECK(Util::parseDuration("30s") == 30s);
    BOOST_CHECK(Util::parseDuration("5m") == 5min);
    BOOST_CHECK(Util::parseDuration("1h") == 1h);

    BOOST_CHECK_THROW(Util::parseDuration(""), std::invalid_argument);
    BOOST_CHECK_THROW(Util::parseDuration("abc"), std::invalid_argument);
    BOOST_CHECK_THROW(Util::parseDuration("-5"), std::invalid_argument);
    BOOST_CHECK_THROW(Util::parseDuration("10x"), std::invalid_argument);

    // range of milliseconds
    BOOST_CHECK(Util::parseDuration("9223372036854775807") == std::chrono::milliseconds::max());
    BOOST_CHECK_THROW(Util::parseDuration("9223372036854775808"), std::invalid_argument);
    BOOST_CHECK_THROW(Util::parseDuration("18446744073709551617"), std::invalid_argument);
    BOOST_CHECK_THROW(Util::parseDuration("9223372036854775807h"), std::invalid_argument);
    BOOST_CHECK_THROW(Util::parseDuration("9223372036854776s"), std::invalid_argument);
    BOOST_CHECK(Util::parseDuration("3000000h") == 3000000h);
}
BOOST_AUTO_TEST_CASE(env)
{
    setenv("TCACHE_EXPIRATION", "2s", 1);
    setenv("TCACHE_PURGE_INTERVAL", "500ms", 1);
    setenv("TCACHE_NAME", "users", 1);

    const auto sConfig = Config::fromEnv("TCACHE");
    BOOST_REQUIRE(sConfig.expiration.has_value());
    BOOST_CHECK(*sConfig.expiration == 2s);
    BOOST_CHECK(sConfig.purge_interval == 500ms);
    BOOST_CHECK_EQUAL(sConfig.name, "users");

    const auto sDefault = Config::fromEnv("TCACHE_UNSET");
    BOOST_CHECK(!sDefault.expiration.has_value());
    BOOST_CHECK(sDefault.purge_interval == Config::DEFAULT_PURGE_INTERVAL);
    BOOST_CHECK_EQUAL(sDefault.name, "cache");

    setenv("TCACHE_EXPIRATION", "soon", 1);
    BOOST_CHECK_THROW(Config::fromEnv("TCACHE"), std::invalid_argument);

    unsetenv("TCACHE_EXPIRATION");
    unsetenv("TCACHE_PURGE_INTERVAL");
    unsetenv("TCACHE_NAME");
}
BOOST_AUTO_TEST_CASE(validate)
{
    auto sCompute = [](int aKey) { return aKey; };

    BOOST_CHECK_THROW(IntCache(sCompute, Config{.purge_interval = 0ms}), Cache::Loading::ConfigError);
    BOOST_CHECK_THROW(IntCache(sCompute, Config{.expiration = -1ms}), Cache::Loading::ConfigError);
    BOOST_CHECK_THROW(IntCache(IntCache::Compute{}), std::invalid_argument);
    BOOST_CHECK_NO_THROW(IntCache(sCompute, Config{.expiration = 0ms, .purge_interval = 1h}));

    // must fit steady_clock after adding to now()
    BOOST_CHECK_THROW(IntCache(sCompute, Config{.expiration = 3000000h}), Cache::Loading::ConfigError);
    BOOST_CHECK_THROW(IntCache(sCompute, Config{.expiration = std::chrono::milliseconds::max()}), Cache::Loading::ConfigError);
    BOOST_CHECK_THROW(IntCache(sCompute, Config{.purge_interval = 3000000h}), Cache::Loading::ConfigError);
}
BOOST_AUTO_TEST_CASE(long_expiration)
{
    // a century still fits, entry must stay alive
    int      sCalls = 0;
    IntCache sCache([&](int aKey) { sCalls++; return aKey; }, Config{.expiration = 876000h, .purge_interval = 1h});
    sCache.Get(1);
    BOOST_CHECK_EQUAL(sCache.Purge(), 0);
    BOOST_CHECK_EQUAL(sCache.Get(1), 1);
    BOOST_CHECK_EQUAL(sCalls, 1);
}
BOOST_AUTO_TEST_SUITE_END()
