#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "common/clock.hpp"

namespace focuslens {

// Size-capped cache with a fixed time-to-live. Expired entries are dropped
// lazily when the cache is touched; when full, the earliest inserted entry is
// evicted. Safe to share between threads.
template <typename Value>
class TtlCache
{
public:
    TtlCache(std::chrono::seconds ttl, std::size_t capacity, Clock clock)
        : m_ttl(ttl)
        , m_capacity(capacity == 0 ? 1 : capacity)
        , m_clock(std::move(clock))
    {
    }

    std::optional<Value> get(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        purgeExpiredLocked();
        auto it = m_entries.find(key);
        if (it == m_entries.end()) {
            return std::nullopt;
        }
        return it->second.value;
    }

    void put(const std::string &key, Value value)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        purgeExpiredLocked();

        auto existing = m_entries.find(key);
        if (existing != m_entries.end()) {
            eraseFromOrderLocked(key);
            m_entries.erase(existing);
        }

        while (m_entries.size() >= m_capacity && !m_order.empty()) {
            m_entries.erase(m_order.front());
            m_order.pop_front();
        }

        m_entries.emplace(key, Entry{std::move(value), m_clock()});
        m_order.push_back(key);
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
        m_order.clear();
    }

    std::size_t size()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        purgeExpiredLocked();
        return m_entries.size();
    }

private:
    struct Entry {
        Value value;
        std::chrono::system_clock::time_point storedAt;
    };

    void purgeExpiredLocked()
    {
        const auto now = m_clock();
        while (!m_order.empty()) {
            auto it = m_entries.find(m_order.front());
            if (it != m_entries.end() && now - it->second.storedAt < m_ttl) {
                break;
            }
            if (it != m_entries.end()) {
                m_entries.erase(it);
            }
            m_order.pop_front();
        }
    }

    void eraseFromOrderLocked(const std::string &key)
    {
        for (auto it = m_order.begin(); it != m_order.end(); ++it) {
            if (*it == key) {
                m_order.erase(it);
                return;
            }
        }
    }

    std::chrono::seconds m_ttl;
    std::size_t m_capacity;
    Clock m_clock;

    std::mutex m_mutex;
    std::map<std::string, Entry> m_entries;
    std::deque<std::string> m_order;
};

} // namespace focuslens
