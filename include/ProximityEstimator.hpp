#pragma once
#include <optional>
#include <string>
#include "Types.hpp"

class StopResolver;

class ProximityEstimator
{
public:
    // Differences outside [1, 20] are noise: vehicle already at the stop, or an index collision.
    static constexpr int MIN_STOPS_AWAY = 1;
    static constexpr int MAX_STOPS_AWAY = 20;

    static std::optional<int> stopsAway(std::string const& vehicleStop,
                                        std::string const& targetStop,
                                        StopResolver const& stops,
                                        RouteStopSequence const& sequence);

private:
    static std::optional<std::size_t> positionOf(std::string const& stopId, RouteStopSequence const& sequence);
};
