#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <stop_token>

#include "Inflight.hpp"
#include "Interface.hpp"

#include <threads/Executor.hpp>

namespace Cache {

    enum class Freshness
    {
        FRESH,
        STALE,
        EXPIRED
    };

    inline std::ostream& operator<<(std::ostream& aStream, Freshness aState)
    {
        switch (aState) {
        case Freshness::FRESH: return aStream << "fresh";
        case Freshness::STALE: return aStream << "stale";
        case Freshness::EXPIRED: return aStream << "expired";
        }
        return aStream << "unknown";
    }

    // aRemaining is logical ttl (stored ttl minus margin)
    inline Freshness classify(Duration aRemaining, Duration aMargin)
    {
        if (aRemaining >= Duration::zero())
            return Freshness::FRESH;
        if (aRemaining >= -aMargin)
            return Freshness::STALE;
        return Freshness::EXPIRED;
    }

    inline constexpr const char* STALEABLE_TYPE = "staleable";

    // stale-while-revalidate wrapper.
    // entries are stored for ttl + max_stale. once ttl is over, value still served
    // for max_stale while single background refresh reloads it.
    // concurrent Get for a key share one store read and one reload.
    // entry put to store directly without expiration reports ttl 0, so with max_stale > 0
    // it is stale on every read and refreshed each time.
    template <class Key, class Value>
    class Staleable : public Interface<Key, Value>
    {
    public:
        using Base     = Interface<Key, Value>;
        using ValueTTL = typename Base::ValueTTL;
        using Load     = std::function<Value(std::stop_token, const Key&)>;
        using Admit    = std::function<bool(const Key&, const Value&)>;

        struct Params
        {
            Duration ttl{0};       // default expiration
            Duration max_stale{0}; // 0 disables stale reads
            Load     load    = {}; // without loader, miss returns Value{}
            Admit    admit   = {}; // loaded value is stored only if admitted
            unsigned workers = 1;  // background refresh threads
        };

    private:
        using Table    = Inflight<Key, Value>;
        using EntryPtr = typename Table::EntryPtr;

        const std::shared_ptr<Base> m_Store;
        const Params                m_Params;
        Table                       m_Inflight;
        Threads::Executor           m_Refresh{"cache-refresh"};
        Threads::Group              m_Group;

        std::optional<ValueTTL> Lookup(const Key& aKey)
        {
            try {
                return GetWithTTL(aKey);
            } catch (const NotFound&) {
                return std::nullopt;
            }
        }

        Value Reload(const Key& aKey, std::stop_token aToken)
        {
            if (!m_Params.load)
                return Value{};

            Value sValue = m_Params.load(aToken, aKey);
            if (m_Params.admit and !m_Params.admit(aKey, sValue)) {
                DEBUG("value for " << printable(aKey) << " not admitted to cache");
                return sValue;
            }
            try {
                Set(aKey, sValue);
            } catch (const std::exception& e) {
                WARN("fail to store value for " << printable(aKey) << ": " << e.what());
            } catch (...) {
                WARN("fail to store value for " << printable(aKey) << ": unknown exception");
            }
            return sValue;
        }

        // entry stays in table until refresh done
        bool Refresh(const Key& aKey, EntryPtr aEntry)
        {
            DEBUG("schedule refresh for " << printable(aKey));
            return m_Refresh.insert([this, aKey, aEntry]() {
                try {
                    Reload(aKey, std::stop_token{});
                } catch (const std::exception& e) {
                    WARN("refresh for " << printable(aKey) << " failed: " << e.what());
                } catch (...) {
                    WARN("refresh for " << printable(aKey) << " failed with unknown exception");
                }
                m_Inflight.Remove(aKey, aEntry);
            });
        }

    public:
        Staleable(std::shared_ptr<Base> aStore, const Params& aParams)
        : m_Store(std::move(aStore))
        , m_Params(aParams)
        {
            if (!m_Store)
                throw std::invalid_argument("staleable cache: no store");
            if (m_Params.max_stale < Duration::zero())
                throw std::invalid_argument("staleable cache: negative max_stale");
            m_Refresh.start(m_Group, std::max(1u, m_Params.workers));
        }

        // pending refreshes are completed before exit
        ~Staleable() { m_Group.wait(); }

        Value Get(const Key& aKey) override
        {
            return Get(aKey, std::stop_token{});
        }

        // token passed to loader on synchronous reload.
        // background refresh never observes it
        Value Get(const Key& aKey, std::stop_token aToken)
        {
            auto [sEntry, sLeader] = m_Inflight.Acquire(aKey);
            if (!sLeader)
                return sEntry->Wait();

            try {
                auto       sCached = Lookup(aKey);
                const auto sState  = sCached ? classify(sCached->second, m_Params.max_stale) : Freshness::EXPIRED;
                TRACE("get " << printable(aKey) << ": " << sState);

                if (sState == Freshness::STALE) {
                    sEntry->Publish(std::move(sCached->first));
                    if (!Refresh(aKey, sEntry))
                        m_Inflight.Remove(aKey, sEntry);
                    return sEntry->Wait();
                }

                if (sState == Freshness::EXPIRED)
                    DEBUG("reload " << printable(aKey));
                Value sResult = sState == Freshness::FRESH ? std::move(sCached->first) : Reload(aKey, aToken);
                m_Inflight.Remove(aKey, sEntry);
                sEntry->Publish(std::move(sResult));
            } catch (...) {
                m_Inflight.Remove(aKey, sEntry);
                sEntry->Fail(std::current_exception());
            }
            return sEntry->Wait();
        }

        // negative ttl: value is stale
        ValueTTL GetWithTTL(const Key& aKey) override
        {
            auto sResult = m_Store->GetWithTTL(aKey);
            sResult.second -= m_Params.max_stale;
            return sResult;
        }

        void Set(const Key& aKey, const Value& aValue, const Options& aOptions = {}) override
        {
            Options sOptions = aOptions;
            if (sOptions.expiration == Duration::zero())
                sOptions.expiration = m_Params.ttl;
            sOptions.expiration += m_Params.max_stale;
            m_Store->Set(aKey, aValue, sOptions);
        }

        void Delete(const Key& aKey) override { m_Store->Delete(aKey); }
        void Invalidate(const InvalidateOptions& aOptions) override { m_Store->Invalidate(aOptions); }
        void Clear() override { m_Store->Clear(); }

        std::string GetType() const override { return STALEABLE_TYPE; }

        // keys with reload or refresh in progress
        size_t Pending() const { return m_Inflight.Size(); }

        // no background refresh queued or running
        bool Idle() const { return m_Refresh.idle(); }
    };
} // namespace Cache
