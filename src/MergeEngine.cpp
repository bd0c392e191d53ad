#include <unordered_map>
#include "MergeEngine.hpp"
#include "ProximityEstimator.hpp"
#include "StopResolver.hpp"
#include "TimeNormalizer.hpp"

std::optional<int> MergeEngine::estimate(PredictionRecord const& prediction,
                                         VehiclePosition const& vehicles,
                                         StopResolver const& stops,
                                         RouteStopSequence const& sequence)
{
    if (!prediction.vehicleId || !prediction.stopId || sequence.empty())
        return std::nullopt;

    auto it = vehicles.find(*prediction.vehicleId);
    if (it == vehicles.end())
        return std::nullopt;

    return ProximityEstimator::stopsAway(it->second, *prediction.stopId, stops, sequence);
}

std::vector<DepartureRow> MergeEngine::merge(StopConfig const& stop,
                                             std::vector<ScheduleRecord> const& schedules,
                                             PredictionBatch const& batch,
                                             StopResolver const& stops,
                                             RouteStopSequence const& sequence)
{
    // last prediction for a trip wins
    std::unordered_map<std::string, PredictionRecord const*> byTrip;
    for (auto const& p : batch.predictions)
        byTrip.insert_or_assign(p.tripId, &p);

    std::vector<DepartureRow> rows;
    rows.reserve(schedules.size());

    for (auto const& s : schedules)
    {
        auto scheduled = TimeNormalizer::parse(pickTime(s, stop.isOrigin));

        std::optional<Instant> predicted;
        std::optional<int> away;

        auto it = byTrip.find(s.tripId);
        if (it != byTrip.end())
        {
            PredictionRecord const& p = *it->second;
            predicted = TimeNormalizer::parse(pickTime(p, stop.isOrigin));
            away = estimate(p, batch.vehicles, stops, sequence);
        }

        if (auto row = DepartureRow::create(scheduled, predicted, away))
            rows.push_back(std::move(*row));
    }

    return rows;
}
