#pragma once
#include <atomic>
#include <chrono>
#include "Types.hpp"

// Wall clock unless pinned to a fixed instant (--at).
class VirtualClock
{
public:
    static void set(Instant t)
    {
        value.store(t.time_since_epoch().count(), std::memory_order_relaxed);
        enabled.store(true, std::memory_order_relaxed);
    }

    static Instant now()
    {
        if (enabled.load(std::memory_order_relaxed))
            return Instant{Instant::duration{value.load(std::memory_order_relaxed)}};
        return date::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    }

private:
    static inline std::atomic<bool> enabled{false};
    static inline std::atomic<Instant::rep> value{0};
};
