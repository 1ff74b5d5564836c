#pragma once

#include <functional>
#include <stddef.h>

#include <boost/intrusive/list.hpp>

namespace svf {

//Tracks externally owned items in least recently used order.
//When maxItems is reached, inserting a new item evicts the least recently used one.
//maxItems == 0 means no limit.
template<class V,
        boost::intrusive::list_member_hook<> (V::*listNodePtr)>
class LRUCachePool {
public:

    LRUCachePool(size_t maxItems, std::function<void(V*)> evictNotify) :
            m_maxItems(maxItems), m_evictNotify(std::move(evictNotify))
    {
    }

    ~LRUCachePool()
    {
        m_items.clear();
    }

    LRUCachePool(const LRUCachePool&) = delete;
    LRUCachePool& operator=(const LRUCachePool&) = delete;

    void insert(V* node)
    {
        if(m_maxItems && m_items.size() >= m_maxItems)
        {
            auto& victim = m_items.front();
            m_items.pop_front();
            m_evictNotify(&victim);
        }
        m_items.push_back(*node);
    }

    void touch(V* node)
    {
        m_items.erase(m_items.iterator_to(*node));
        m_items.push_back(*node);
    }

    void remove(V* node)
    {
        if((node->*listNodePtr).is_linked())
        {
            m_items.erase(m_items.iterator_to(*node));
        }
    }

    void clear()
    {
        m_items.clear();
    }

    size_t size()const
    {
        return m_items.size();
    }

private:

    using PoolNodeHookOption = boost::intrusive::member_hook<V, boost::intrusive::list_member_hook<>, listNodePtr>;
    using PoolList = boost::intrusive::list<V, PoolNodeHookOption, boost::intrusive::constant_time_size<true>>;
    size_t m_maxItems;
    std::function<void(V*)> m_evictNotify;
    PoolList m_items;
};

}
