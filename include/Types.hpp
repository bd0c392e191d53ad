#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <utility>
#include <chrono>
#include <date/date.h>

// All instants are UTC time points; the local zone is applied only when formatting.
using Instant = date::sys_seconds;

// One scheduled stop-event of a trip.
struct ScheduleRecord
{
    std::optional<std::string> arrivalTime;
    std::optional<std::string> departureTime;
    std::string tripId;
};

// One live stop-event of a trip.
struct PredictionRecord
{
    std::optional<std::string> arrivalTime;
    std::optional<std::string> departureTime;
    std::string tripId;
    std::optional<std::string> vehicleId;
    std::optional<std::string> stopId;    // child stop the prediction targets
};

using VehiclePosition   = std::unordered_map<std::string, std::string>;  // vehicle -> current child stop
using StopParentMap     = std::unordered_map<std::string, std::string>;  // child stop -> parent station
using RouteStopSequence = std::vector<std::string>;

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Predictions together with the lookup tables built from the sideloaded resources.
struct PredictionBatch
{
    std::vector<PredictionRecord> predictions;
    VehiclePosition vehicles;
    StopParentMap parents;
};

struct StopConfig
{
    std::string routeId;
    std::string stopId;
    int directionId = 0;
    bool isOrigin = false;    // origin stops use the departure time
};

// One candidate departure. At least one of the two times is always present.
class DepartureRow
{
private:
    std::optional<Instant> scheduled;
    std::optional<Instant> predicted;
    std::optional<int> stopsAway;

    DepartureRow(std::optional<Instant> sched, std::optional<Instant> pred, std::optional<int> away)
        : scheduled(sched), predicted(pred), stopsAway(away) {}

public:
    static std::optional<DepartureRow> create(std::optional<Instant> sched,
                                              std::optional<Instant> pred,
                                              std::optional<int> away = std::nullopt)
    {
        if (!sched && !pred)
            return std::nullopt;
        return DepartureRow(sched, pred, away);
    }

    std::optional<Instant> const& scheduledTime() const noexcept { return scheduled; }
    std::optional<Instant> const& predictedTime() const noexcept { return predicted; }
    std::optional<int> const& stops() const noexcept { return stopsAway; }
};
