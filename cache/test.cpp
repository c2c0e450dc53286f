#define BOOST_TEST_MODULE Suites
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <future>
#include <map>
#include <mutex>
#include <vector>

#include "Inflight.hpp"
#include "LRU.hpp"
#include "Memory.hpp"
#include "Settings.hpp"
#include "StaleStore.hpp"
#include "Staleable.hpp"

#include <threads/Group.hpp>

using namespace std::chrono_literals;

namespace {
    // store with constant time: ttl returned as it was set. counts calls
    struct Fake : public Cache::Interface<std::string, std::string>
    {
        using Lock = std::unique_lock<std::mutex>;

        mutable std::mutex                                   m_Mutex;
        std::map<std::string, ValueTTL>                      m_Data;
        std::vector<std::pair<std::string, Cache::Options>> m_Sets;
        std::vector<std::string>                             m_Invalidated;
        unsigned                                             m_Reads   = 0;
        unsigned                                             m_Deletes = 0;
        unsigned                                             m_Clears  = 0;
        bool                                                 m_FailGet = false;
        bool                                                 m_FailSet = false;
        bool                                                 m_FailRaw = false; // Set throws not std::exception

        std::string Get(const std::string& aKey) override { return GetWithTTL(aKey).first; }

        ValueTTL GetWithTTL(const std::string& aKey) override
        {
            Lock lk(m_Mutex);
            m_Reads++;
            if (m_FailGet)
                throw std::runtime_error("store is down");
            auto sIt = m_Data.find(aKey);
            if (sIt == m_Data.end())
                throw Cache::NotFound("not found");
            return sIt->second;
        }

        void Set(const std::string& aKey, const std::string& aValue, const Cache::Options& aOptions = {}) override
        {
            Lock lk(m_Mutex);
            m_Sets.push_back({aKey, aOptions});
            if (m_FailSet)
                throw std::runtime_error("store is read only");
            if (m_FailRaw)
                throw 42;
            m_Data[aKey] = ValueTTL(aValue, aOptions.expiration);
        }

        void Delete(const std::string& aKey) override
        {
            Lock lk(m_Mutex);
            m_Deletes++;
            m_Data.erase(aKey);
        }

        void Invalidate(const Cache::InvalidateOptions& aOptions) override
        {
            Lock lk(m_Mutex);
            m_Invalidated.insert(m_Invalidated.end(), aOptions.tags.begin(), aOptions.tags.end());
        }

        void Clear() override
        {
            Lock lk(m_Mutex);
            m_Clears++;
            m_Data.clear();
        }

        std::string GetType() const override { return "fake"; }

        void put(const std::string& aKey, const std::string& aValue, Cache::Duration aTTL)
        {
            Lock lk(m_Mutex);
            m_Data[aKey] = ValueTTL(aValue, aTTL);
        }
        size_t sets() const
        {
            Lock lk(m_Mutex);
            return m_Sets.size();
        }
        unsigned reads() const
        {
            Lock lk(m_Mutex);
            return m_Reads;
        }
    };

    using StaleCache = Cache::Staleable<std::string, std::string>;

    // run aCount readers of aKey in parallel, collect results
    std::vector<std::string> parallelGet(StaleCache& aCache, const std::string& aKey, unsigned aCount)
    {
        std::mutex               sMutex;
        std::vector<std::string> sResult;
        {
            Threads::Group sGroup;
            sGroup.start(
                [&]() {
                    std::string sValue;
                    try {
                        sValue = aCache.Get(aKey);
                    } catch (const std::exception& e) {
                        sValue = std::string("error: ") + e.what();
                    } catch (...) {
                        sValue = "error: unknown";
                    }
                    std::unique_lock lk(sMutex);
                    sResult.push_back(sValue);
                },
                aCount);
        }
        return sResult;
    }

    void waitIdle(const StaleCache& aCache)
    {
        for (int i = 0; i < 500 and !(aCache.Idle() and aCache.Pending() == 0); i++)
            Threads::sleep(10ms);
    }
} // namespace

BOOST_AUTO_TEST_SUITE(Cache)
BOOST_AUTO_TEST_CASE(lru)
{
    std::vector<int>     sEvicted;
    Cache::LRU<int, int> cache(10, [&sEvicted](const int& aKey, const int&) { sEvicted.push_back(aKey); });
    BOOST_CHECK(cache.Get(1) == nullptr);

    // drop element from cache
    for (int i = 0; i < 20; i++) {
        cache.Put(i, i);
    }
    for (int i = 0; i < 20; i++) {
        if (i < 10) {
            BOOST_CHECK(cache.Get(i) == nullptr);
        } else {
            BOOST_CHECK(*cache.Get(i) == i);
        }
    }
    BOOST_CHECK_EQUAL(sEvicted.size(), 10);
    BOOST_CHECK_EQUAL(sEvicted.front(), 0);

    BOOST_CHECK(cache.Remove(15));
    BOOST_CHECK(!cache.Remove(15));
    BOOST_CHECK_EQUAL(cache.Size(), 9);
    BOOST_CHECK_EQUAL(sEvicted.size(), 10); // explicit remove is not eviction

    cache.Clear();
    BOOST_CHECK_EQUAL(cache.Size(), 0);
    BOOST_CHECK(cache.Get(19) == nullptr);
}
BOOST_AUTO_TEST_CASE(freshness)
{
    using Cache::Freshness;
    const Cache::Duration sMargin = 5000ms;

    BOOST_CHECK_EQUAL(Cache::classify(1000ms, sMargin), Freshness::FRESH);
    BOOST_CHECK_EQUAL(Cache::classify(0ms, sMargin), Freshness::FRESH);
    BOOST_CHECK_EQUAL(Cache::classify(-1ms, sMargin), Freshness::STALE);
    BOOST_CHECK_EQUAL(Cache::classify(-sMargin + 1ms, sMargin), Freshness::STALE);
    BOOST_CHECK_EQUAL(Cache::classify(-sMargin, sMargin), Freshness::STALE);
    BOOST_CHECK_EQUAL(Cache::classify(-sMargin - 1ms, sMargin), Freshness::EXPIRED);

    // no margin: stale state not possible
    BOOST_CHECK_EQUAL(Cache::classify(0ms, 0ms), Freshness::FRESH);
    BOOST_CHECK_EQUAL(Cache::classify(-1ms, 0ms), Freshness::EXPIRED);
}
BOOST_AUTO_TEST_SUITE_END() // Cache

BOOST_AUTO_TEST_SUITE(Inflight)
BOOST_AUTO_TEST_CASE(leader)
{
    Cache::Inflight<std::string, int> sTable;

    auto [sFirst, sLeader1]  = sTable.Acquire("a");
    auto [sSecond, sLeader2] = sTable.Acquire("a");
    auto [sOther, sLeader3]  = sTable.Acquire("b");
    BOOST_CHECK(sLeader1);
    BOOST_CHECK(!sLeader2);
    BOOST_CHECK(sLeader3);
    BOOST_CHECK(sFirst == sSecond);
    BOOST_CHECK_EQUAL(sTable.Size(), 2);

    BOOST_CHECK(!sFirst->Ready());
    BOOST_CHECK(sFirst->Publish(42));
    BOOST_CHECK(!sFirst->Publish(43));
    BOOST_CHECK(!sFirst->Fail(std::make_exception_ptr(std::runtime_error("late"))));
    BOOST_CHECK(sSecond->Ready());
    BOOST_CHECK_EQUAL(sSecond->Wait(), 42);

    // stale pointer do not remove new entry
    sTable.Remove("a", sFirst);
    auto [sThird, sLeader4] = sTable.Acquire("a");
    BOOST_CHECK(sLeader4);
    sTable.Remove("a", sFirst);
    BOOST_CHECK_EQUAL(sTable.Size(), 2);
    sTable.Remove("a", sThird);
    sTable.Remove("b", sOther);
    BOOST_CHECK_EQUAL(sTable.Size(), 0);
}
BOOST_AUTO_TEST_CASE(broadcast)
{
    Cache::Inflight<int, int> sTable;
    auto sAcquired = sTable.Acquire(1);
    auto sEntry    = sAcquired.first;
    BOOST_REQUIRE(sAcquired.second);

    std::atomic<int> sFailed{0};
    {
        Threads::Group sGroup;
        sGroup.start(
            [&sEntry, &sFailed]() {
                try {
                    sEntry->Wait();
                } catch (const std::runtime_error&) {
                    sFailed++;
                }
            },
            4);
        Threads::sleep(50ms);
        sEntry->Fail(std::make_exception_ptr(std::runtime_error("load failed")));
    }
    BOOST_CHECK_EQUAL(sFailed.load(), 4);
    BOOST_CHECK_THROW(sEntry->Wait(), std::runtime_error);
}
BOOST_AUTO_TEST_SUITE_END() // Inflight

BOOST_AUTO_TEST_SUITE(Staleable)
BOOST_AUTO_TEST_CASE(params)
{
    auto sStore = std::make_shared<Fake>();
    BOOST_CHECK_THROW(StaleCache(nullptr, {}), std::invalid_argument);
    BOOST_CHECK_THROW(StaleCache(sStore, {.max_stale = -1s}), std::invalid_argument);

    StaleCache sCache(sStore, {.max_stale = 1s});
    BOOST_CHECK_EQUAL(sCache.GetType(), Cache::STALEABLE_TYPE);
}
BOOST_AUTO_TEST_CASE(fresh)
{
    auto sStore = std::make_shared<Fake>();
    sStore->put("my-key", "my-value", 1min);

    std::atomic<int> sLoads = 0;
    StaleCache sCache(sStore, {.max_stale = 1s, .load = [&sLoads](std::stop_token, const std::string&) {
                                    sLoads++;
                                    return std::string("updated");
                                }});
    BOOST_CHECK_EQUAL(sCache.Get("my-key"), "my-value");
    waitIdle(sCache);
    BOOST_CHECK_EQUAL(sLoads.load(), 0);
    BOOST_CHECK_EQUAL(sStore->sets(), 0);
    BOOST_CHECK_EQUAL(sCache.Pending(), 0);
}
BOOST_AUTO_TEST_CASE(ttl)
{
    auto sStore = std::make_shared<Fake>();
    sStore->put("fresh", "a", 6s);
    sStore->put("stale", "b", 3s);
    sStore->put("gone", "c", 0s);

    StaleCache sCache(sStore, {.max_stale = 5s});

    auto [sValue, sTTL] = sCache.GetWithTTL("fresh");
    BOOST_CHECK_EQUAL(sValue, "a");
    BOOST_CHECK_EQUAL(sTTL.count(), 1000);
    BOOST_CHECK_EQUAL(sCache.GetWithTTL("stale").second.count(), -2000);
    BOOST_CHECK_EQUAL(sCache.GetWithTTL("gone").second.count(), -5000);
    BOOST_CHECK_THROW(sCache.GetWithTTL("missing"), Cache::NotFound);

    // pure read: no load, no coalescing
    BOOST_CHECK_EQUAL(sStore->sets(), 0);
    BOOST_CHECK_EQUAL(sCache.Pending(), 0);
}
BOOST_AUTO_TEST_CASE(set)
{
    auto        sStore = std::make_shared<Fake>();
    StaleCache sCache(sStore, {.ttl = 10s, .max_stale = 5s});

    sCache.Set("a", "1", {.expiration = 1s, .tags = {"tag"}});
    sCache.Set("b", "2");

    BOOST_REQUIRE_EQUAL(sStore->m_Sets.size(), 2);
    BOOST_CHECK_EQUAL(sStore->m_Sets[0].second.expiration.count(), 6000);
    BOOST_CHECK_EQUAL(sStore->m_Sets[0].second.tags.size(), 1);
    BOOST_CHECK_EQUAL(sStore->m_Sets[1].second.expiration.count(), 15000); // default ttl

    sStore->m_FailSet = true;
    BOOST_CHECK_THROW(sCache.Set("c", "3"), std::runtime_error);
}
BOOST_AUTO_TEST_CASE(delegate)
{
    auto        sStore = std::make_shared<Fake>();
    StaleCache sCache(sStore, {.max_stale = 1s});

    sStore->put("a", "1", 1s);
    sCache.Delete("a");
    BOOST_CHECK_EQUAL(sStore->m_Deletes, 1);
    BOOST_CHECK_THROW(sStore->GetWithTTL("a"), Cache::NotFound);

    sCache.Invalidate({.tags = {"a23fdf987h2svc23", "jHG2372x38hf74"}});
    BOOST_CHECK_EQUAL(sStore->m_Invalidated.size(), 2);
    BOOST_CHECK_EQUAL(sStore->m_Invalidated[1], "jHG2372x38hf74");

    sCache.Clear();
    BOOST_CHECK_EQUAL(sStore->m_Clears, 1);
}
BOOST_AUTO_TEST_CASE(no_loader)
{
    auto        sStore = std::make_shared<Fake>();
    StaleCache sCache(sStore, {.max_stale = 3s});

    BOOST_CHECK_EQUAL(sCache.Get("my-key"), "");
    BOOST_CHECK_EQUAL(sStore->sets(), 0);
    BOOST_CHECK_EQUAL(sCache.Pending(), 0);
}
BOOST_AUTO_TEST_CASE(store_error)
{
    auto sStore       = std::make_shared<Fake>();
    sStore->m_FailGet = true;

    std::atomic<int> sLoads = 0;
    StaleCache sCache(sStore, {.max_stale = 3s, .load = [&sLoads](std::stop_token, const std::string&) {
                                    sLoads++;
                                    return std::string("loaded");
                                }});
    BOOST_CHECK_THROW(sCache.Get("my-key"), std::runtime_error);
    BOOST_CHECK_THROW(sCache.GetWithTTL("my-key"), std::runtime_error);
    BOOST_CHECK_EQUAL(sLoads.load(), 0);
    BOOST_CHECK_EQUAL(sCache.Pending(), 0);
}
BOOST_AUTO_TEST_CASE(expired)
{
    auto sStore = std::make_shared<Fake>();
    sStore->put("my-key", "my-value", -1s); // not purged by store yet

    StaleCache sCache(sStore, {.ttl = 1s, .max_stale = 0s, .load = [](std::stop_token, const std::string&) {
                                    return std::string("updated");
                                }});
    BOOST_CHECK_EQUAL(sCache.Get("my-key"), "updated");
    BOOST_REQUIRE_EQUAL(sStore->sets(), 1);
    BOOST_CHECK_EQUAL(sStore->m_Sets[0].second.expiration.count(), 1000);
}
BOOST_AUTO_TEST_CASE(expired_beyond_margin)
{
    auto sStore = std::make_shared<Fake>();
    sStore->put("my-key", "my-value", -1s); // logical ttl -1m-1s

    StaleCache sCache(sStore, {.ttl = 1s, .max_stale = 1min, .load = [](std::stop_token, const std::string&) {
                                    return std::string("updated");
                                }});
    BOOST_CHECK_EQUAL(sCache.Get("my-key"), "updated");
    BOOST_REQUIRE_EQUAL(sStore->sets(), 1);
    BOOST_CHECK_EQUAL(sStore->m_Sets[0].second.expiration.count(), 61000);
    BOOST_CHECK_EQUAL(sCache.Pending(), 0);
}
BOOST_AUTO_TEST_CASE(stale)
{
    auto sStore = std::make_shared<Fake>();
    sStore->put("my-key", "my-value", 3s); // logical ttl -2s

    std::promise<void> sGate;
    auto               sOpen = sGate.get_future().share();
    StaleCache        sCache(sStore, {.ttl = 1s, .max_stale = 5s, .load = [sOpen](std::stop_token, const std::string&) {
                                    sOpen.wait();
                                    return std::string("updated");
                                }});

    // refresh can't complete while gate closed, so Get returns without waiting for it
    BOOST_CHECK_EQUAL(sCache.Get("my-key"), "my-value");
    BOOST_CHECK_EQUAL(sCache.Pending(), 1);
    BOOST_CHECK_EQUAL(sStore->sets(), 0);

    sGate.set_value();
    waitIdle(sCache);
    BOOST_CHECK_EQUAL(sCache.Pending(), 0);
    BOOST_REQUIRE_EQUAL(sStore->sets(), 1);
    BOOST_CHECK_EQUAL(sStore->m_Sets[0].second.expiration.count(), 6000);
    BOOST_CHECK_EQUAL(sCache.Get("my-key"), "updated");
}
BOOST_AUTO_TEST_CASE(stale_parallel)
{
    auto sStore = std::make_shared<Fake>();
    sStore->put("my-key", "my-value", 59s); // logical ttl -1s

    std::promise<void> sGate;
    auto               sOpen  = sGate.get_future().share();
    std::atomic<int>   sLoads = 0;
    StaleCache        sCache(sStore, {.ttl = 1s, .max_stale = 1min, .load = [sOpen, &sLoads](std::stop_token, const std::string&) {
                                    sLoads++;
                                    sOpen.wait();
                                    return std::string("updated");
                                }});

    const auto sResult = parallelGet(sCache, "my-key", 8);
    BOOST_CHECK_EQUAL(sResult.size(), 8);
    for (auto& x : sResult)
        BOOST_CHECK_EQUAL(x, "my-value");
    BOOST_CHECK_EQUAL(sStore->reads(), 1);

    sGate.set_value();
    waitIdle(sCache);
    BOOST_CHECK_EQUAL(sLoads.load(), 1);
    BOOST_REQUIRE_EQUAL(sStore->sets(), 1);
    BOOST_CHECK_EQUAL(sStore->m_Sets[0].second.expiration.count(), 61000);
}
BOOST_AUTO_TEST_CASE(missing_parallel)
{
    auto             sStore = std::make_shared<Fake>();
    std::atomic<int> sLoads = 0;
    StaleCache      sCache(sStore, {.max_stale = 3s, .load = [&sLoads](std::stop_token, const std::string&) {
                                    sLoads++;
                                    Threads::sleep(200ms);
                                    return std::string("my-value");
                                }});

    const auto sResult = parallelGet(sCache, "my-key", 8);
    BOOST_CHECK_EQUAL(sResult.size(), 8);
    for (auto& x : sResult)
        BOOST_CHECK_EQUAL(x, "my-value");
    BOOST_CHECK_EQUAL(sLoads.load(), 1);
    BOOST_REQUIRE_EQUAL(sStore->sets(), 1);
    BOOST_CHECK_EQUAL(sStore->m_Sets[0].second.expiration.count(), 3000);
    BOOST_CHECK_EQUAL(sCache.Pending(), 0);
}
BOOST_AUTO_TEST_CASE(loader_error_parallel)
{
    auto        sStore = std::make_shared<Fake>();
    StaleCache sCache(sStore, {.max_stale = 3s, .load = [](std::stop_token, const std::string&) -> std::string {
                                    Threads::sleep(200ms);
                                    throw std::runtime_error("my-cache-error");
                                }});

    const auto sResult = parallelGet(sCache, "my-key", 8);
    BOOST_CHECK_EQUAL(sResult.size(), 8);
    for (auto& x : sResult)
        BOOST_CHECK_EQUAL(x, "error: my-cache-error");
    BOOST_CHECK_EQUAL(sStore->sets(), 0);
    BOOST_CHECK_EQUAL(sCache.Pending(), 0);
}
BOOST_AUTO_TEST_CASE(not_admitted_parallel)
{
    auto        sStore = std::make_shared<Fake>();
    StaleCache sCache(sStore, {.max_stale = 3s,
                                .load      = [](std::stop_token, const std::string&) {
                                    Threads::sleep(200ms);
                                    return std::string("my-value");
                                },
                                .admit = [](const std::string&, const std::string&) { return false; }});

    const auto sResult = parallelGet(sCache, "my-key", 8);
    BOOST_CHECK_EQUAL(sResult.size(), 8);
    for (auto& x : sResult)
        BOOST_CHECK_EQUAL(x, "my-value");
    BOOST_CHECK_EQUAL(sStore->sets(), 0);
}
BOOST_AUTO_TEST_CASE(store_write_error)
{
    auto sStore       = std::make_shared<Fake>();
    sStore->m_FailSet = true;

    StaleCache sCache(sStore, {.max_stale = 3s, .load = [](std::stop_token, const std::string&) {
                                    return std::string("loaded");
                                }});
    BOOST_CHECK_EQUAL(sCache.Get("my-key"), "loaded");
    BOOST_CHECK_EQUAL(sStore->sets(), 1);
    BOOST_CHECK_EQUAL(sCache.Pending(), 0);
}
BOOST_AUTO_TEST_CASE(store_write_error_raw)
{
    auto sStore       = std::make_shared<Fake>();
    sStore->m_FailRaw = true;

    StaleCache sCache(sStore, {.max_stale = 3s, .load = [](std::stop_token, const std::string&) {
                                    Threads::sleep(100ms);
                                    return std::string("loaded");
                                }});
    const auto sResult = parallelGet(sCache, "my-key", 4);
    BOOST_CHECK_EQUAL(sResult.size(), 4);
    for (auto& x : sResult)
        BOOST_CHECK_EQUAL(x, "loaded");
    BOOST_CHECK_GE(sStore->sets(), 1);
    BOOST_CHECK_EQUAL(sCache.Pending(), 0);
}
BOOST_AUTO_TEST_CASE(refresh_error)
{
    auto sStore = std::make_shared<Fake>();
    sStore->put("my-key", "my-value", 1s);

    std::atomic<int> sLoads = 0;
    StaleCache      sCache(sStore, {.ttl = 1s, .max_stale = 2s, .load = [&sLoads](std::stop_token, const std::string&) -> std::string {
                                    sLoads++;
                                    throw std::runtime_error("backend down");
                                }});

    BOOST_CHECK_EQUAL(sCache.Get("my-key"), "my-value");
    waitIdle(sCache);
    BOOST_CHECK_EQUAL(sLoads.load(), 1);
    BOOST_CHECK_EQUAL(sStore->sets(), 0);
    BOOST_CHECK_EQUAL(sCache.Pending(), 0);

    // entry released: next reader triggers refresh again
    BOOST_CHECK_EQUAL(sCache.Get("my-key"), "my-value");
    waitIdle(sCache);
    BOOST_CHECK_EQUAL(sLoads.load(), 2);
}
BOOST_AUTO_TEST_CASE(refresh_error_raw)
{
    auto sStore = std::make_shared<Fake>();
    sStore->put("my-key", "my-value", 1s);

    std::atomic<int> sLoads = 0;
    StaleCache      sCache(sStore, {.ttl = 1s, .max_stale = 2s, .load = [&sLoads](std::stop_token, const std::string&) -> std::string {
                                    sLoads++;
                                    throw 42;
                                }});

    BOOST_CHECK_EQUAL(sCache.Get("my-key"), "my-value");
    waitIdle(sCache);
    BOOST_CHECK_EQUAL(sLoads.load(), 1);
    BOOST_CHECK_EQUAL(sCache.Pending(), 0);

    BOOST_CHECK_EQUAL(sCache.Get("my-key"), "my-value");
    waitIdle(sCache);
    BOOST_CHECK_EQUAL(sLoads.load(), 2);
    BOOST_CHECK_EQUAL(sCache.Pending(), 0);
    BOOST_CHECK_EQUAL(sStore->sets(), 0);
}
BOOST_AUTO_TEST_CASE(cancel)
{
    auto sStore = std::make_shared<Fake>();
    sStore->put("stale", "old", 1s);

    std::mutex                  sMutex;
    std::map<std::string, bool> sStopPossible;
    std::map<std::string, bool> sStopRequested;
    StaleCache                 sCache(sStore, {.ttl = 1s, .max_stale = 2s, .load = [&](std::stop_token aToken, const std::string& aKey) {
                                    std::unique_lock lk(sMutex);
                                    sStopPossible[aKey]  = aToken.stop_possible();
                                    sStopRequested[aKey] = aToken.stop_requested();
                                    return std::string("new");
                                }});

    std::stop_source sSource;
    sSource.request_stop();

    // synchronous reload observes caller token
    BOOST_CHECK_EQUAL(sCache.Get("missing", sSource.get_token()), "new");
    // background refresh is detached from it
    BOOST_CHECK_EQUAL(sCache.Get("stale", sSource.get_token()), "old");
    waitIdle(sCache);

    std::unique_lock lk(sMutex);
    BOOST_CHECK(sStopRequested["missing"]);
    BOOST_CHECK(!sStopPossible["stale"]);
    BOOST_CHECK(!sStopRequested["stale"]);
}
BOOST_AUTO_TEST_CASE(drain_on_destroy)
{
    auto sStore = std::make_shared<Fake>();
    sStore->put("my-key", "my-value", 1s);
    {
        StaleCache sCache(sStore, {.ttl = 1s, .max_stale = 2s, .load = [](std::stop_token, const std::string&) {
                                        Threads::sleep(100ms);
                                        return std::string("updated");
                                    }});
        BOOST_CHECK_EQUAL(sCache.Get("my-key"), "my-value");
    }
    BOOST_CHECK_EQUAL(sStore->sets(), 1);
    BOOST_CHECK_EQUAL(sStore->Get("my-key"), "updated");
}
BOOST_AUTO_TEST_SUITE_END() // Staleable

BOOST_AUTO_TEST_SUITE(Memory)
struct Clock
{
    using TimePoint = Cache::Memory<std::string, std::string>::TimePoint;

    const TimePoint           m_Base = std::chrono::steady_clock::now();
    std::atomic<int64_t>      m_Offset{0}; // ms

    TimePoint now() const { return m_Base + std::chrono::milliseconds(m_Offset.load()); }
    void      advance(std::chrono::milliseconds aDelta) { m_Offset += aDelta.count(); }
};
using Store = Cache::Memory<std::string, std::string>;

BOOST_AUTO_TEST_CASE(basic)
{
    Clock sClock;
    Store sStore({.max_size = 10, .clock = [&sClock]() { return sClock.now(); }});
    BOOST_CHECK_EQUAL(sStore.GetType(), Cache::MEMORY_TYPE);
    BOOST_CHECK_THROW(sStore.Get("a"), Cache::NotFound);

    sStore.Set("a", "1", {.expiration = 10s});
    sStore.Set("b", "2");
    BOOST_CHECK_EQUAL(sStore.Get("a"), "1");
    BOOST_CHECK_EQUAL(sStore.GetWithTTL("a").second.count(), 10000);
    BOOST_CHECK_EQUAL(sStore.GetWithTTL("b").second.count(), 0); // no expiration

    sClock.advance(4s);
    BOOST_CHECK_EQUAL(sStore.GetWithTTL("a").second.count(), 6000);

    sClock.advance(6s);
    BOOST_CHECK_THROW(sStore.GetWithTTL("a"), Cache::NotFound);
    BOOST_CHECK_EQUAL(sStore.Size(), 1); // expired entry dropped
    BOOST_CHECK_EQUAL(sStore.Get("b"), "2");

    sStore.Delete("b");
    BOOST_CHECK_THROW(sStore.Get("b"), Cache::NotFound);
    sStore.Delete("b");
}
BOOST_AUTO_TEST_CASE(tags)
{
    Store sStore({.max_size = 3});
    sStore.Set("a", "1", {.tags = {"user:1", "users"}});
    sStore.Set("b", "2", {.tags = {"user:2", "users"}});
    sStore.Set("c", "3", {.tags = {"other"}});

    sStore.Invalidate({.tags = {"user:1"}});
    BOOST_CHECK_THROW(sStore.Get("a"), Cache::NotFound);
    BOOST_CHECK_EQUAL(sStore.Get("b"), "2");

    // re-set drops old tags
    sStore.Set("b", "2", {.tags = {"other"}});
    sStore.Invalidate({.tags = {"users"}});
    BOOST_CHECK_EQUAL(sStore.Get("b"), "2");

    // evicted key is not touched by invalidate
    sStore.Set("d", "4", {.tags = {"users"}});
    sStore.Set("e", "5", {.tags = {"users"}});
    BOOST_CHECK_EQUAL(sStore.Size(), 3);
    sStore.Invalidate({.tags = {"other"}});
    BOOST_CHECK_EQUAL(sStore.Size(), 2);
    sStore.Invalidate({.tags = {"users"}});
    BOOST_CHECK_EQUAL(sStore.Size(), 0);

    sStore.Set("f", "6", {.tags = {"users"}});
    sStore.Clear();
    BOOST_CHECK_EQUAL(sStore.Size(), 0);
    sStore.Invalidate({.tags = {"users"}});
}
BOOST_AUTO_TEST_CASE(staleable)
{
    Clock sClock;
    auto  sStore = std::make_shared<Store>(Store::Params{.max_size = 100, .clock = [&sClock]() { return sClock.now(); }});

    std::atomic<int> sVersion = 0;
    StaleCache      sCache(sStore, {.ttl = 10s, .max_stale = 5s, .load = [&sVersion](std::stop_token, const std::string& aKey) {
                                    return aKey + ":" + std::to_string(++sVersion);
                                }});

    // miss: synchronous load
    BOOST_CHECK_EQUAL(sCache.Get("k"), "k:1");
    BOOST_CHECK_EQUAL(sStore->GetWithTTL("k").second.count(), 15000);
    BOOST_CHECK_EQUAL(sCache.GetWithTTL("k").second.count(), 10000);

    // fresh
    sClock.advance(9s);
    BOOST_CHECK_EQUAL(sCache.Get("k"), "k:1");
    waitIdle(sCache);
    BOOST_CHECK_EQUAL(sVersion.load(), 1);

    // stale: old value, refresh in background
    sClock.advance(3s);
    BOOST_CHECK_EQUAL(sCache.GetWithTTL("k").second.count(), -2000);
    BOOST_CHECK_EQUAL(sCache.Get("k"), "k:1");
    waitIdle(sCache);
    BOOST_CHECK_EQUAL(sCache.Get("k"), "k:2");

    // expired and purged by store: synchronous load
    sClock.advance(16s);
    BOOST_CHECK_EQUAL(sCache.Get("k"), "k:3");
}
BOOST_AUTO_TEST_CASE(no_expiration)
{
    auto sStore = std::make_shared<Store>(Store::Params{.max_size = 100});
    sStore->Set("k", "direct"); // no expiration: reported ttl 0

    std::atomic<int> sLoads = 0;
    StaleCache      sCache(sStore, {.ttl = 10s, .max_stale = 5s, .load = [&sLoads](std::stop_token, const std::string&) {
                                    sLoads++;
                                    return std::string("loaded");
                                }});
    BOOST_CHECK_EQUAL(sCache.GetWithTTL("k").second.count(), -5000);
    BOOST_CHECK_EQUAL(sCache.Get("k"), "direct");
    waitIdle(sCache);
    BOOST_CHECK_EQUAL(sLoads.load(), 1);

    // refreshed value carries expiration and is fresh
    BOOST_CHECK_EQUAL(sCache.Get("k"), "loaded");
    waitIdle(sCache);
    BOOST_CHECK_EQUAL(sLoads.load(), 1);
}
BOOST_AUTO_TEST_SUITE_END() // Memory

BOOST_AUTO_TEST_SUITE(StaleStore)
BOOST_AUTO_TEST_CASE(basic)
{
    auto                                        sStore = std::make_shared<Fake>();
    Cache::StaleStore<std::string, std::string> sWrapper(sStore, 5s);
    BOOST_CHECK_EQUAL(sWrapper.GetType(), Cache::STALE_STORE_TYPE);
    BOOST_CHECK_THROW((Cache::StaleStore<std::string, std::string>(sStore, -1s)), std::invalid_argument);

    sWrapper.Set("a", "1", {.expiration = 1s});
    sWrapper.Set("b", "2");
    BOOST_CHECK_EQUAL(sStore->m_Sets[0].second.expiration.count(), 6000);
    BOOST_CHECK_EQUAL(sStore->m_Sets[1].second.expiration.count(), 5000);

    BOOST_CHECK_EQUAL(sWrapper.GetWithTTL("a").second.count(), 1000);
    BOOST_CHECK_EQUAL(sWrapper.GetWithTTL("b").second.count(), 0);
    sStore->put("c", "3", 3s);
    BOOST_CHECK_EQUAL(sWrapper.GetWithTTL("c").second.count(), -2000);
    BOOST_CHECK_EQUAL(sWrapper.Get("c"), "3");
    BOOST_CHECK_THROW(sWrapper.GetWithTTL("d"), Cache::NotFound);

    sWrapper.Delete("a");
    sWrapper.Invalidate({.tags = {"x"}});
    sWrapper.Clear();
    BOOST_CHECK_EQUAL(sStore->m_Deletes, 1);
    BOOST_CHECK_EQUAL(sStore->m_Invalidated.size(), 1);
    BOOST_CHECK_EQUAL(sStore->m_Clears, 1);
}
BOOST_AUTO_TEST_SUITE_END() // StaleStore

BOOST_AUTO_TEST_SUITE(Settings)
BOOST_AUTO_TEST_CASE(configure)
{
    Config::Manager sManager("");
    sManager.properties().set("cache:ttl", "30s");
    sManager.properties().set("cache:max_stale", "5m");

    StaleCache::Params sParams{.ttl = 1s, .max_stale = 1s, .workers = 3};
    {
        Config::Context sCtx("cache");
        Cache::configure(sParams, sManager);
    }
    BOOST_CHECK_EQUAL(sParams.ttl.count(), 30000);
    BOOST_CHECK_EQUAL(sParams.max_stale.count(), 300000);
    BOOST_CHECK_EQUAL(sParams.workers, 3);

    sManager.properties().set("broken:ttl", "soon");
    Config::Context sCtx("broken");
    BOOST_CHECK_THROW(Cache::configure(sParams, sManager), std::invalid_argument);
}
BOOST_AUTO_TEST_SUITE_END() // Settings
