#pragma once

#include <cstddef>
#include <iterator>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace jb::music {

// List-backed LRU map. get() marks an entry most-recently-used; put() evicts
// the least-recently-used entry once capacity is reached. Not thread-safe.
template <typename Key, typename Value>
class lru_cache {
public:
    explicit lru_cache(std::size_t capacity)
        : m_capacity(capacity == 0 ? 1 : capacity)
    {
    }

    std::optional<Value> get(const Key& key)
    {
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            return std::nullopt;
        }
        m_items.splice(m_items.end(), m_items, it->second);
        return it->second->second;
    }

    void put(const Key& key, Value value)
    {
        auto it = m_index.find(key);
        if (it != m_index.end()) {
            it->second->second = std::move(value);
            m_items.splice(m_items.end(), m_items, it->second);
            return;
        }

        if (m_items.size() >= m_capacity) {
            m_index.erase(m_items.front().first);
            m_items.pop_front();
        }

        m_items.emplace_back(key, std::move(value));
        m_index[key] = std::prev(m_items.end());
    }

    bool contains(const Key& key) const { return m_index.count(key) > 0; }

    bool erase(const Key& key)
    {
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            return false;
        }
        m_items.erase(it->second);
        m_index.erase(it);
        return true;
    }

    void clear()
    {
        m_items.clear();
        m_index.clear();
    }

    std::size_t size() const { return m_items.size(); }
    std::size_t capacity() const { return m_capacity; }

    // Least-recently-used first.
    std::list<Key> keys() const
    {
        std::list<Key> out;
        for (const auto& item : m_items) {
            out.push_back(item.first);
        }
        return out;
    }

private:
    using item = std::pair<Key, Value>;

    std::size_t     m_capacity;
    std::list<item> m_items;
    std::unordered_map<Key, typename std::list<item>::iterator> m_index;
};

} // namespace jb::music
