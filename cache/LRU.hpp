#pragma once
#include <functional>
#include <list>
#include <map>

#include <boost/core/noncopyable.hpp>

namespace Cache {

    // not thread safe
    template <class Key, class Value>
    class LRU : public boost::noncopyable
    {
    public:
        // called for entries dropped to fit size limit
        using Evict = std::function<void(const Key&, const Value&)>;

    private:
        using List = std::list<std::pair<Key, Value>>;
        using Map  = std::map<Key, typename List::iterator>;

        List         m_Lru;
        Map          m_Index;
        const size_t m_MaxSize;
        const Evict  m_Evict;

        void Update(const typename Map::iterator& i)
        {
            m_Lru.splice(m_Lru.begin(), m_Lru, i->second);
        }

        void Insert(const Key& key, const Value& value)
        {
            m_Lru.push_front(std::make_pair(key, value));
            m_Index[key] = m_Lru.begin();
        }

        void Shrink()
        {
            while (m_Lru.size() > m_MaxSize) {
                auto& sLast = m_Lru.back();
                if (m_Evict)
                    m_Evict(sLast.first, sLast.second);
                m_Index.erase(sLast.first);
                m_Lru.pop_back();
            }
        }

    public:
        explicit LRU(size_t aSize, Evict aEvict = {})
        : m_MaxSize(aSize)
        , m_Evict(std::move(aEvict))
        {}

        const Value* Get(const Key& key)
        {
            auto i = m_Index.find(key);
            if (i != m_Index.end()) {
                Update(i);
                return &i->second->second;
            }
            return nullptr;
        }

        void Put(const Key& key, const Value& value)
        {
            auto i = m_Index.find(key);
            if (i != m_Index.end()) {
                Update(i);
                i->second->second = value;
            } else {
                Insert(key, value);
                Shrink();
            }
        }

        bool Remove(const Key& key)
        {
            auto i = m_Index.find(key);
            if (i == m_Index.end())
                return false;
            m_Lru.erase(i->second);
            m_Index.erase(i);
            return true;
        }

        void Clear()
        {
            m_Index.clear();
            m_Lru.clear();
        }

        size_t Size() const { return m_Lru.size(); }
    };
} // namespace Cache
