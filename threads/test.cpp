#define BOOST_TEST_MODULE Suites
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>

#include "Executor.hpp"
#include "Group.hpp"

using namespace std::chrono_literals;

BOOST_AUTO_TEST_SUITE(Threads)
BOOST_AUTO_TEST_CASE(group)
{
    std::atomic<int> sCounter{0};
    std::atomic<int> sStopped{0};
    {
        Threads::Group sGroup;
        sGroup.start([&sCounter]() { sCounter++; }, 3);
        sGroup.at_stop([&sStopped]() { sStopped++; });
        BOOST_CHECK_EQUAL(sGroup.size(), 3);
        sGroup.wait();
        BOOST_CHECK_EQUAL(sGroup.size(), 0);
    }
    BOOST_CHECK_EQUAL(sCounter.load(), 3);
    BOOST_CHECK_EQUAL(sStopped.load(), 1); // stoppers called once
}
BOOST_AUTO_TEST_CASE(executor)
{
    std::atomic<int> sCounter{0};
    Threads::Group    sGroup;
    Threads::Executor sExecutor("test-executor");
    sExecutor.start(sGroup, 4);

    for (int i = 0; i < 100; i++)
        BOOST_CHECK(sExecutor.insert([&sCounter]() { sCounter++; }));

    sGroup.wait();
    BOOST_CHECK_EQUAL(sCounter.load(), 100); // queue drained on stop
    BOOST_CHECK_EQUAL(sExecutor.count(), 100);
    BOOST_CHECK(sExecutor.idle());
    BOOST_CHECK_EQUAL(sExecutor.size(), 0);

    BOOST_CHECK(!sExecutor.insert([&sCounter]() { sCounter++; }));
    BOOST_CHECK_EQUAL(sExecutor.count(), 100);
}
BOOST_AUTO_TEST_CASE(busy)
{
    std::promise<void> sGate;
    auto               sFuture = sGate.get_future().share();

    Threads::Group    sGroup;
    Threads::Executor sExecutor;
    sExecutor.start(sGroup);
    BOOST_CHECK(sExecutor.idle());

    sExecutor.insert([sFuture]() { sFuture.wait(); });
    sExecutor.insert([]() {});
    BOOST_CHECK(!sExecutor.idle());
    BOOST_CHECK_EQUAL(sExecutor.size(), 2);

    sGate.set_value();
    while (!sExecutor.idle())
        Threads::sleep(1ms);
    BOOST_CHECK_EQUAL(sExecutor.size(), 0);
    sGroup.wait();
}
BOOST_AUTO_TEST_CASE(error)
{
    std::atomic<int>  sCounter{0};
    Threads::Group    sGroup;
    Threads::Executor sExecutor;
    sExecutor.start(sGroup);

    sExecutor.insert([]() { throw std::runtime_error("task error"); });
    sExecutor.insert([]() { throw 42; });
    sExecutor.insert([&sCounter]() { sCounter++; });
    sGroup.wait();
    BOOST_CHECK_EQUAL(sCounter.load(), 1); // worker survived failed task
}
BOOST_AUTO_TEST_SUITE_END()
