#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace focuslens {

// Components never read the wall clock directly so that tests and the replay
// harness can drive time explicitly.
using Clock = std::function<std::chrono::system_clock::time_point()>;

inline Clock systemClock()
{
    return [] { return std::chrono::system_clock::now(); };
}

// Settable time source. Every Clock handed out by clock() observes set() and
// advance() on this instance. Not thread safe.
class ManualClock
{
public:
    explicit ManualClock(std::chrono::system_clock::time_point start)
        : m_now(std::make_shared<std::chrono::system_clock::time_point>(start))
    {
    }

    Clock clock() const
    {
        auto now = m_now;
        return [now] { return *now; };
    }

    std::chrono::system_clock::time_point now() const
    {
        return *m_now;
    }

    void set(std::chrono::system_clock::time_point value)
    {
        *m_now = value;
    }

    void advance(std::chrono::seconds delta)
    {
        *m_now += delta;
    }

private:
    std::shared_ptr<std::chrono::system_clock::time_point> m_now;
};

} // namespace focuslens
