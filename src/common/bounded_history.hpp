#pragma once

#include <cstddef>
#include <deque>
#include <vector>

namespace focuslens {

// Append-only sequence that keeps at most `capacity` items; the oldest item is
// evicted first. Not synchronized, owners guard it with their own mutex.
template <typename T>
class BoundedHistory
{
public:
    explicit BoundedHistory(std::size_t capacity)
        : m_capacity(capacity == 0 ? 1 : capacity)
    {
    }

    // Returns how many items were evicted to make room.
    std::size_t push(T value)
    {
        m_items.push_back(std::move(value));
        std::size_t evicted = 0;
        while (m_items.size() > m_capacity) {
            m_items.pop_front();
            ++evicted;
        }
        return evicted;
    }

    void clear()
    {
        m_items.clear();
    }

    std::size_t size() const
    {
        return m_items.size();
    }

    bool empty() const
    {
        return m_items.empty();
    }

    std::size_t capacity() const
    {
        return m_capacity;
    }

    const T &back() const
    {
        return m_items.back();
    }

    T &back()
    {
        return m_items.back();
    }

    const T &front() const
    {
        return m_items.front();
    }

    typename std::deque<T>::const_iterator begin() const
    {
        return m_items.begin();
    }

    typename std::deque<T>::const_iterator end() const
    {
        return m_items.end();
    }

    typename std::deque<T>::iterator begin()
    {
        return m_items.begin();
    }

    typename std::deque<T>::iterator end()
    {
        return m_items.end();
    }

    std::vector<T> toVector() const
    {
        return std::vector<T>(m_items.begin(), m_items.end());
    }

private:
    std::size_t m_capacity;
    std::deque<T> m_items;
};

} // namespace focuslens
