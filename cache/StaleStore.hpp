#pragma once

#include <memory>
#include <stdexcept>

#include "Interface.hpp"

namespace Cache {

    inline constexpr const char* STALE_STORE_TYPE = "stale-cache-wrapper";

    // store level wrapper: keeps entries for margin after expiration,
    // GetWithTTL reports negative ttl for such entries.
    // no loading and no request coalescing, see Staleable for that
    template <class Key, class Value>
    class StaleStore : public Interface<Key, Value>
    {
        using Base = Interface<Key, Value>;

        const std::shared_ptr<Base> m_Store;
        const Duration              m_Margin;

    public:
        using ValueTTL = typename Base::ValueTTL;

        StaleStore(std::shared_ptr<Base> aStore, Duration aMargin)
        : m_Store(std::move(aStore))
        , m_Margin(aMargin)
        {
            if (!m_Store)
                throw std::invalid_argument("stale store: no store");
            if (m_Margin < Duration::zero())
                throw std::invalid_argument("stale store: negative margin");
        }

        Value Get(const Key& aKey) override { return m_Store->Get(aKey); }

        ValueTTL GetWithTTL(const Key& aKey) override
        {
            auto sResult = m_Store->GetWithTTL(aKey);
            sResult.second -= m_Margin;
            return sResult;
        }

        // unlike Staleable, no default ttl: zero expiration becomes margin
        void Set(const Key& aKey, const Value& aValue, const Options& aOptions = {}) override
        {
            Options sOptions = aOptions;
            sOptions.expiration += m_Margin;
            m_Store->Set(aKey, aValue, sOptions);
        }

        void Delete(const Key& aKey) override { m_Store->Delete(aKey); }
        void Invalidate(const InvalidateOptions& aOptions) override { m_Store->Invalidate(aOptions); }
        void Clear() override { m_Store->Clear(); }

        std::string GetType() const override { return STALE_STORE_TYPE; }
    };
} // namespace Cache
