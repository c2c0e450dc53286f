#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "Interface.hpp"
#include "LRU.hpp"

namespace Cache {

    inline constexpr const char* MEMORY_TYPE = "memory";

    // in-process store with per-entry expiration and tags.
    // expired entries are dropped on access, size limited by LRU.
    template <class Key, class Value>
    class Memory : public Interface<Key, Value>
    {
    public:
        using Clock     = std::chrono::steady_clock;
        using TimePoint = Clock::time_point;
        using ValueTTL  = typename Interface<Key, Value>::ValueTTL;

        struct Params
        {
            size_t                     max_size = 10000;
            std::function<TimePoint()> clock    = Clock::now;
        };

    private:
        struct Entry
        {
            Value                    value      = {};
            std::optional<TimePoint> expires_at = {}; // no expiration if empty
            std::vector<std::string> tags       = {};
        };

        using Lock = std::unique_lock<std::mutex>;
        using Tags = std::map<std::string, std::set<Key>>;

        mutable std::mutex                m_Mutex;
        const std::function<TimePoint()>  m_Clock;
        Tags                              m_Tags;
        LRU<Key, Entry>                   m_Cache;

        void Unindex(const Key& aKey, const std::vector<std::string>& aTags)
        {
            for (auto& x : aTags) {
                auto sIt = m_Tags.find(x);
                if (sIt == m_Tags.end())
                    continue;
                sIt->second.erase(aKey);
                if (sIt->second.empty())
                    m_Tags.erase(sIt);
            }
        }

        void Drop(const Key& aKey, const Entry& aEntry)
        {
            Unindex(aKey, aEntry.tags);
            m_Cache.Remove(aKey);
        }

        // live entry or NotFound, must be called with lock held
        const Entry& Find(const Key& aKey, TimePoint aNow)
        {
            auto sPtr = m_Cache.Get(aKey);
            if (sPtr == nullptr)
                throw NotFound("key not found");
            if (sPtr->expires_at and *sPtr->expires_at <= aNow) { // expired
                Drop(aKey, *sPtr);
                throw NotFound("key expired");
            }
            return *sPtr;
        }

    public:
        explicit Memory(const Params& aParams)
        : m_Clock(aParams.clock)
        , m_Cache(aParams.max_size, [this](const Key& aKey, const Entry& aEntry) { Unindex(aKey, aEntry.tags); })
        {}

        Value Get(const Key& aKey) override
        {
            Lock lk(m_Mutex);
            return Find(aKey, m_Clock()).value;
        }

        // ttl is 0 for entry without expiration
        ValueTTL GetWithTTL(const Key& aKey) override
        {
            Lock         lk(m_Mutex);
            const auto   sNow   = m_Clock();
            const Entry& sEntry = Find(aKey, sNow);
            Duration     sTTL{0};
            if (sEntry.expires_at)
                sTTL = std::chrono::duration_cast<Duration>(*sEntry.expires_at - sNow);
            return {sEntry.value, sTTL};
        }

        // expiration 0: keep until deleted or evicted
        void Set(const Key& aKey, const Value& aValue, const Options& aOptions = {}) override
        {
            Entry sEntry{.value = aValue, .expires_at = {}, .tags = aOptions.tags};
            if (aOptions.expiration > Duration::zero())
                sEntry.expires_at = m_Clock() + aOptions.expiration;

            Lock lk(m_Mutex);
            if (auto sOld = m_Cache.Get(aKey); sOld != nullptr)
                Unindex(aKey, sOld->tags);
            m_Cache.Put(aKey, sEntry);
            for (auto& x : sEntry.tags)
                m_Tags[x].insert(aKey);
        }

        void Delete(const Key& aKey) override
        {
            Lock lk(m_Mutex);
            if (auto sPtr = m_Cache.Get(aKey); sPtr != nullptr)
                Drop(aKey, *sPtr);
        }

        // drop all keys marked with any of tags
        void Invalidate(const InvalidateOptions& aOptions) override
        {
            Lock lk(m_Mutex);
            for (auto& sTag : aOptions.tags) {
                auto sIt = m_Tags.find(sTag);
                if (sIt == m_Tags.end())
                    continue;
                const std::set<Key> sKeys = sIt->second;
                for (auto& sKey : sKeys)
                    if (auto sPtr = m_Cache.Get(sKey); sPtr != nullptr)
                        Drop(sKey, *sPtr);
            }
        }

        void Clear() override
        {
            Lock lk(m_Mutex);
            m_Cache.Clear();
            m_Tags.clear();
        }

        std::string GetType() const override { return MEMORY_TYPE; }

        size_t Size() const
        {
            Lock lk(m_Mutex);
            return m_Cache.Size();
        }
    };
} // namespace Cache
