#define BOOST_TEST_MODULE Suites
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <thread>

#include "Periodic.hpp"

using namespace std::chrono_literals;

BOOST_AUTO_TEST_SUITE(periodic)
BOOST_AUTO_TEST_CASE(simple)
{
    std::atomic<int>  sCount{0};
    Threads::Periodic sTask;
    sTask.start("periodic-test", 10ms, [&sCount]() { sCount++; });

    std::this_thread::sleep_for(200ms);
    BOOST_CHECK(sTask.stop());
    sTask.wait();

    const int sRuns = sCount;
    BOOST_TEST_MESSAGE("handler called " << sRuns << " times");
    BOOST_CHECK_GT(sRuns, 3);

    std::this_thread::sleep_for(50ms);
    BOOST_CHECK_EQUAL(sCount.load(), sRuns);
}
BOOST_AUTO_TEST_CASE(exception)
{
    std::atomic<int> sCalls{0};
    std::atomic<int> sDone{0};
    {
        Threads::Periodic sTask;
        sTask.start("periodic-err", 10ms, [&]() {
            if (sCalls++ < 2)
                throw std::runtime_error("transient failure");
            sDone++;
        });
        std::this_thread::sleep_for(200ms);
    }
    BOOST_CHECK_GT(sDone.load(), 0);
}
BOOST_AUTO_TEST_CASE(foreign_exception)
{
    std::atomic<int> sCalls{0};
    {
        Threads::Periodic sTask;
        sTask.start("periodic-int", 10ms, [&sCalls]() {
            if (sCalls++ == 0)
                throw 42;
        });
        std::this_thread::sleep_for(200ms);
    }
    BOOST_CHECK_GT(sCalls.load(), 1);
}
BOOST_AUTO_TEST_CASE(stop)
{
    Threads::Periodic sTask;
    BOOST_CHECK(!sTask.stopped());
    BOOST_CHECK(sTask.stop());
    BOOST_CHECK(!sTask.stop());
    BOOST_CHECK(sTask.stopped());
    sTask.wait();
}
BOOST_AUTO_TEST_CASE(long_period)
{
    std::atomic<int> sCount{0};
    const auto       sStart = std::chrono::steady_clock::now();
    {
        Threads::Periodic sTask;
        sTask.start("periodic-long", 1h, [&sCount]() { sCount++; });
        std::this_thread::sleep_for(20ms);
    }
    // destructor must not wait for a whole period
    BOOST_CHECK(std::chrono::steady_clock::now() - sStart < 1s);
    BOOST_CHECK_EQUAL(sCount.load(), 0);
}
BOOST_AUTO_TEST_CASE(bad_start)
{
    Threads::Periodic sTask;
    BOOST_CHECK_THROW(sTask.start("periodic-bad", 0ms, []() {}), std::invalid_argument);

    sTask.start("periodic-twice", 1h, []() {});
    BOOST_CHECK_THROW(sTask.start("periodic-twice", 1h, []() {}), std::logic_error);
}
BOOST_AUTO_TEST_SUITE_END()
