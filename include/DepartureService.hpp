#pragma once
#include <functional>
#include <string>
#include <vector>
#include <boost/asio/awaitable.hpp>
#include <date/tz.h>
#include "Types.hpp"

class StopResolver;

// Fetches, merges and ranks the departures of one monitored stop.
class DepartureService
{
public:
    // GET of an API path; resolves to the response body. MbtaClient::get in production.
    using Fetch = std::function<boost::asio::awaitable<std::string>(std::string path, QueryParams params)>;

    // Throws RateLimitedError, FetchError, DecodeError or whatever the transport throws.
    static boost::asio::awaitable<std::vector<DepartureRow>> computeDepartureRows(Fetch fetch,
                                                                                  StopConfig stop,
                                                                                  Instant now,
                                                                                  date::time_zone const* zone);

private:
    static boost::asio::awaitable<std::vector<ScheduleRecord>> fetchSchedules(Fetch const& fetch, StopConfig stop, Instant now, date::time_zone const* zone);
    static boost::asio::awaitable<PredictionBatch> fetchPredictions(Fetch const& fetch, StopConfig stop);
    static boost::asio::awaitable<void> resolveParents(Fetch const& fetch, StopResolver& stops, std::vector<std::string> ids);
    static boost::asio::awaitable<RouteStopSequence> fetchRouteStops(Fetch const& fetch, StopConfig stop);
};
