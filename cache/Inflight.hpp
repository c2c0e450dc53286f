#pragma once

#include <condition_variable>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace Cache {

    // key -> operation in progress.
    // first caller for a key becomes a leader and must complete entry,
    // others wait for the result of the same entry.
    template <class Key, class Value>
    class Inflight
    {
    public:
        // single-shot result: value or exception, broadcast to all waiters
        class Entry
        {
            using Lock = std::unique_lock<std::mutex>;

            mutable std::mutex              m_Mutex;
            mutable std::condition_variable m_Cond;
            bool                            m_Ready = false;
            Value                           m_Value{};
            std::exception_ptr              m_Error;

        public:
            // only first Publish/Fail is effective
            bool Publish(Value aValue)
            {
                Lock lk(m_Mutex);
                if (m_Ready)
                    return false;
                m_Value = std::move(aValue);
                m_Ready = true;
                m_Cond.notify_all();
                return true;
            }

            bool Fail(std::exception_ptr aError)
            {
                Lock lk(m_Mutex);
                if (m_Ready)
                    return false;
                m_Error = aError;
                m_Ready = true;
                m_Cond.notify_all();
                return true;
            }

            bool Ready() const
            {
                Lock lk(m_Mutex);
                return m_Ready;
            }

            Value Wait() const
            {
                Lock lk(m_Mutex);
                m_Cond.wait(lk, [this]() { return m_Ready; });
                if (m_Error)
                    std::rethrow_exception(m_Error);
                return m_Value;
            }
        };
        using EntryPtr = std::shared_ptr<Entry>;

    private:
        using Lock = std::unique_lock<std::mutex>;
        using Map  = std::map<Key, EntryPtr>;

        mutable std::mutex m_Mutex;
        Map                m_Entries;

    public:
        // returns entry and true if new entry created (caller is a leader)
        std::pair<EntryPtr, bool> Acquire(const Key& aKey)
        {
            Lock lk(m_Mutex);
            auto [sIt, sCreated] = m_Entries.try_emplace(aKey);
            if (sCreated)
                sIt->second = std::make_shared<Entry>();
            return {sIt->second, sCreated};
        }

        // remove entry only if key still maps to it
        void Remove(const Key& aKey, const EntryPtr& aEntry)
        {
            Lock lk(m_Mutex);
            auto sIt = m_Entries.find(aKey);
            if (sIt != m_Entries.end() and sIt->second == aEntry)
                m_Entries.erase(sIt);
        }

        size_t Size() const
        {
            Lock lk(m_Mutex);
            return m_Entries.size();
        }
    };
} // namespace Cache
