#include <algorithm>
#include <cstdlib>
#include "ProximityEstimator.hpp"
#include "StopResolver.hpp"

std::optional<std::size_t> ProximityEstimator::positionOf(std::string const& stopId, RouteStopSequence const& sequence)
{
    auto it = std::find(sequence.begin(), sequence.end(), stopId);
    if (it == sequence.end())
        return std::nullopt;

    return static_cast<std::size_t>(it - sequence.begin());
}

std::optional<int> ProximityEstimator::stopsAway(std::string const& vehicleStop,
                                                 std::string const& targetStop,
                                                 StopResolver const& stops,
                                                 RouteStopSequence const& sequence)
{
    if (sequence.empty())
        return std::nullopt;

    auto vehicleIdx = positionOf(stops.getParent(vehicleStop), sequence);
    auto targetIdx  = positionOf(stops.getParent(targetStop), sequence);
    if (!vehicleIdx || !targetIdx)
        return std::nullopt;

    int diff = std::abs(static_cast<int>(*targetIdx) - static_cast<int>(*vehicleIdx));
    if (diff < MIN_STOPS_AWAY || diff > MAX_STOPS_AWAY)
        return std::nullopt;

    return diff;
}
