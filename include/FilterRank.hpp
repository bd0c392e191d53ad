#pragma once
#include <chrono>
#include <vector>
#include "Types.hpp"

class FilterRank
{
public:
    static constexpr std::chrono::minutes STALE_AFTER{5};

    static std::vector<DepartureRow> apply(std::vector<DepartureRow> rows, Instant now);

    static bool isFresh(DepartureRow const& row, Instant now);
    static Instant effectiveTime(DepartureRow const& row, Instant now);
};
