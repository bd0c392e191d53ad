#pragma once
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"

class StopResolver;

// Joins one stop's schedule and predictions by trip. Schedule-driven: a prediction
// without a scheduled trip is dropped.
class MergeEngine
{
public:
    static std::vector<DepartureRow> merge(StopConfig const& stop,
                                           std::vector<ScheduleRecord> const& schedules,
                                           PredictionBatch const& batch,
                                           StopResolver const& stops,
                                           RouteStopSequence const& sequence);

    template <typename Record>
    static std::optional<std::string> pickTime(Record const& record, bool isOrigin)
    {
        if (isOrigin)
            return record.departureTime;
        return record.arrivalTime ? record.arrivalTime : record.departureTime;
    }

private:
    static std::optional<int> estimate(PredictionRecord const& prediction,
                                       VehiclePosition const& vehicles,
                                       StopResolver const& stops,
                                       RouteStopSequence const& sequence);
};
