#include <iostream>
#include "ConfigurationManager.hpp"
#include "DepartureService.hpp"
#include "Errors.hpp"
#include "FilterRank.hpp"
#include "MergeEngine.hpp"
#include "Parser.hpp"
#include "StopResolver.hpp"
#include "TimeNormalizer.hpp"

namespace
{
    std::string joinIds(std::vector<std::string> const& ids)
    {
        std::string out;
        for (auto const& id : ids)
        {
            if (!out.empty())
                out += ',';
            out += id;
        }
        return out;
    }
}

boost::asio::awaitable<std::vector<ScheduleRecord>> DepartureService::fetchSchedules(Fetch const& fetch, StopConfig stop, Instant now, date::time_zone const* zone)
{
    // look back to catch delayed trips
    Instant lookback = now - std::chrono::minutes(ConfigurationManager::SCHEDULE_LOOKBACK_MINUTES);

    std::string body = co_await fetch("/schedules", {
        {"filter[stop]",         stop.stopId},
        {"filter[route]",        stop.routeId},
        {"filter[direction_id]", std::to_string(stop.directionId)},
        {"sort",                 "arrival_time"},
        {"filter[min_time]",     TimeNormalizer::formatClock(lookback, zone)},
        {"page[limit]",          std::to_string(ConfigurationManager::SCHEDULE_PAGE_LIMIT)},
    });

    try
    {
        co_return Parser::parseSchedules(body);
    }
    catch (DecodeError const& e)
    {
        std::cerr << "[Fetch] Failed to parse schedule JSON: " << e.what() << "\n"
                  << "[Fetch] Raw Body: " << body << "\n";
        throw;
    }
}

boost::asio::awaitable<PredictionBatch> DepartureService::fetchPredictions(Fetch const& fetch, StopConfig stop)
{
    std::string body = co_await fetch("/predictions", {
        {"filter[stop]",         stop.stopId},
        {"filter[route]",        stop.routeId},
        {"filter[direction_id]", std::to_string(stop.directionId)},
        {"sort",                 "arrival_time"},
        {"page[limit]",          std::to_string(ConfigurationManager::PREDICTION_PAGE_LIMIT)},
        {"include",              "vehicle,stop"},
    });

    try
    {
        co_return Parser::parsePredictions(body);
    }
    catch (DecodeError const& e)
    {
        std::cerr << "[Fetch] Failed to parse prediction JSON: " << e.what() << "\n"
                  << "[Fetch] Raw Body: " << body << "\n";
        throw;
    }
}

boost::asio::awaitable<void> DepartureService::resolveParents(Fetch const& fetch, StopResolver& stops, std::vector<std::string> ids)
{
    std::vector<std::string> missing = stops.unresolved(ids);
    if (missing.empty())
        co_return;

    try
    {
        std::string body = co_await fetch("/stops", {{"filter[id]", joinIds(missing)}});
        stops.absorb(Parser::parseStopParents(body));
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Resolve] Parent lookup for " << missing.size()
                  << " stops failed, using the stops themselves: " << e.what() << "\n";
    }

    stops.settle(missing);
}

boost::asio::awaitable<RouteStopSequence> DepartureService::fetchRouteStops(Fetch const& fetch, StopConfig stop)
{
    try
    {
        std::string body = co_await fetch("/stops", {
            {"filter[route]",        stop.routeId},
            {"filter[direction_id]", std::to_string(stop.directionId)},
        });
        co_return Parser::parseRouteStops(body);
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Route] Stop list for route " << stop.routeId
                  << " unavailable, stop counts disabled: " << e.what() << "\n";
    }
    co_return RouteStopSequence{};
}

boost::asio::awaitable<std::vector<DepartureRow>> DepartureService::computeDepartureRows(Fetch fetch,
                                                                                         StopConfig stop,
                                                                                         Instant now,
                                                                                         date::time_zone const* zone)
{
    std::vector<ScheduleRecord> schedules = co_await fetchSchedules(fetch, stop, now, zone);
    PredictionBatch batch = co_await fetchPredictions(fetch, stop);

    StopResolver stops(batch.parents);
    co_await resolveParents(fetch, stops, StopResolver::lookupIds(batch));

    RouteStopSequence sequence = co_await fetchRouteStops(fetch, stop);

    std::vector<DepartureRow> rows = MergeEngine::merge(stop, schedules, batch, stops, sequence);
    co_return FilterRank::apply(std::move(rows), now);
}
