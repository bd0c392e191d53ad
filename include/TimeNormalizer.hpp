#pragma once
#include <optional>
#include <string>
#include <chrono>
#include <date/tz.h>
#include "Types.hpp"

class TimeNormalizer
{
public:
    // RFC-3339 ("2024-03-01T08:00:00-05:00", "...Z", optional fraction). Anything else is absent.
    static std::optional<Instant> parse(std::optional<std::string> const& timestamp);

    static std::string formatClock(Instant t, date::time_zone const* zone, bool withSeconds = false);

    // Whole minutes from `from` to `to`, truncated toward zero.
    static std::chrono::minutes minutesBetween(Instant from, Instant to);
};
