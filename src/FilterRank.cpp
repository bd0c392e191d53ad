#include <algorithm>
#include "FilterRank.hpp"
#include "TimeNormalizer.hpp"

bool FilterRank::isFresh(DepartureRow const& row, Instant now)
{
    std::chrono::minutes sDiff{0};
    if (row.scheduledTime())
        sDiff = TimeNormalizer::minutesBetween(now, *row.scheduledTime());

    std::chrono::minutes pDiff = sDiff;
    if (row.predictedTime())
        pDiff = TimeNormalizer::minutesBetween(now, *row.predictedTime());

    return sDiff > -STALE_AFTER || pDiff > -STALE_AFTER;
}

Instant FilterRank::effectiveTime(DepartureRow const& row, Instant now)
{
    if (row.predictedTime())
        return *row.predictedTime();
    if (row.scheduledTime())
        return *row.scheduledTime();
    return now + date::days{1};
}

std::vector<DepartureRow> FilterRank::apply(std::vector<DepartureRow> rows, Instant now)
{
    std::vector<DepartureRow> kept;
    kept.reserve(rows.size());
    for (auto& row : rows)
    {
        if (isFresh(row, now))
            kept.push_back(std::move(row));
    }

    // once live data exists, schedule-only rows that are not in the future are superseded
    bool hasLive = std::any_of(kept.begin(), kept.end(),
                               [](DepartureRow const& r) { return r.predictedTime().has_value(); });
    if (hasLive)
    {
        kept.erase(std::remove_if(kept.begin(), kept.end(),
                                  [now](DepartureRow const& r)
                                  {
                                      bool futureSchedule = r.scheduledTime() && *r.scheduledTime() > now;
                                      return !r.predictedTime() && !futureSchedule;
                                  }),
                   kept.end());
    }

    std::stable_sort(kept.begin(), kept.end(),
                     [now](DepartureRow const& a, DepartureRow const& b)
                     {
                         return effectiveTime(a, now) < effectiveTime(b, now);
                     });

    return kept;
}
