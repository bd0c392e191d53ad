#include <set>
#include <sstream>

#include "gtest/gtest.h"

#include "boost/asio/awaitable.hpp"
#include "boost/asio/io_context.hpp"

#include "date/date.h"
#include "date/tz.h"

#include "DepartureBoard.hpp"
#include "Errors.hpp"

using namespace date;
using namespace std::chrono_literals;

namespace
{
    Instant const now{sys_days{2024_y / March / 1} + 8h};

    std::string param(QueryParams const& params, std::string const& key)
    {
        for (auto const& [k, v] : params)
        {
            if (k == key)
                return v;
        }
        return {};
    }

    // Canned MBTA answers: one trip per stop, its vehicle two stops up the route.
    struct FakeApi
    {
        std::set<std::string> rateLimitedStops;
        std::set<std::string> garbledStops;
        bool stopLookupsFail = false;

        std::string respond(std::string const& path, QueryParams const& params) const
        {
            if (path == "/schedules")
            {
                std::string stop = param(params, "filter[stop]");
                if (rateLimitedStops.count(stop))
                    throw RateLimitedError();
                if (garbledStops.count(stop))
                    return "<html>502 Bad Gateway</html>";
                return R"({"data": [{"attributes": {"arrival_time": "2024-03-01T08:05:00Z", "departure_time": null},
                                     "relationships": {"trip": {"data": {"id": "t-)" + stop + R"("}}}}]})";
            }

            if (path == "/predictions")
            {
                std::string stop = param(params, "filter[stop]");
                return R"({"data": [{"attributes": {"arrival_time": "2024-03-01T08:06:00Z", "departure_time": null},
                                     "relationships": {"trip": {"data": {"id": "t-)" + stop + R"("}},
                                                       "vehicle": {"data": {"id": "y1"}},
                                                       "stop": {"data": {"id": ")" + stop + R"("}}}}],
                           "included": [{"type": "vehicle", "id": "y1",
                                         "relationships": {"stop": {"data": {"id": "70001"}}}}]})";
            }

            if (path == "/stops")
            {
                if (stopLookupsFail)
                    throw FetchError("HTTP 500 from /stops");

                if (!param(params, "filter[id]").empty())
                    return R"({"data": [{"id": "70001", "relationships": {"parent_station": {"data": {"id": "place-a"}}}}]})";

                return R"({"data": [{"id": "place-a"}, {"id": "place-b"}, {"id": "1519"}, {"id": "1553"}]})";
            }

            throw FetchError("unexpected path " + path);
        }

        DepartureService::Fetch fetcher() const
        {
            return [this](std::string path, QueryParams params) -> boost::asio::awaitable<std::string>
            {
                co_return respond(path, params);
            };
        }
    };

    std::vector<BoardGroup> twoGroups()
    {
        return {
            {"Route 60", {{"Brookline Ave", {"60", "1519", 0, false}}, {"High St", {"60", "1553", 0, false}}}},
            {"Green Line D", {{"Copley", {"Green-D", "place-coecl", 0, false}}}},
        };
    }

    std::optional<std::vector<GroupRows>> runBoard(FakeApi const& api,
                                                   std::vector<BoardGroup> const& groups,
                                                   std::ostream& diagnostics)
    {
        boost::asio::io_context io;
        DepartureBoard board(groups);
        board.spawn(io, api.fetcher(), now, locate_zone("UTC"));
        io.run();
        return board.collect(diagnostics);
    }
}

TEST(DepartureBoard, AllStopsRenderWithProximity)
{
    FakeApi api;
    auto groups = twoGroups();
    std::ostringstream diagnostics;

    auto board = runBoard(api, groups, diagnostics);

    ASSERT_TRUE(board);
    ASSERT_EQ(2u, board->size());
    EXPECT_EQ("Route 60", (*board)[0].title);
    ASSERT_EQ(2u, (*board)[0].stops.size());

    auto const& [name, rows] = (*board)[0].stops[0];
    EXPECT_EQ("Brookline Ave", name);
    ASSERT_EQ(1u, rows.size());
    EXPECT_EQ(now + 5min, rows[0].scheduledTime());
    EXPECT_EQ(now + 6min, rows[0].predictedTime());
    EXPECT_EQ(2, rows[0].stops());

    EXPECT_EQ(3, (*board)[0].stops[1].second[0].stops());
    EXPECT_TRUE(diagnostics.str().empty());
}

TEST(DepartureBoard, RateLimitOnOneStopSuppressesBoard)
{
    FakeApi api;
    api.rateLimitedStops = {"place-coecl"};
    auto groups = twoGroups();
    std::ostringstream diagnostics;

    EXPECT_FALSE(runBoard(api, groups, diagnostics));
}

TEST(DepartureBoard, DecodeFailureEmptiesOnlyThatStop)
{
    FakeApi api;
    api.garbledStops = {"1553"};
    auto groups = twoGroups();
    std::ostringstream diagnostics;

    auto board = runBoard(api, groups, diagnostics);

    ASSERT_TRUE(board);
    EXPECT_EQ(1u, (*board)[0].stops[0].second.size());
    EXPECT_TRUE((*board)[0].stops[1].second.empty());
    EXPECT_EQ(1u, (*board)[1].stops[0].second.size());
    EXPECT_NE(std::string::npos, diagnostics.str().find("Error fetching High St data"));
    EXPECT_EQ(std::string::npos, diagnostics.str().find("Brookline Ave"));
}

TEST(DepartureBoard, FailedStopLookupsOnlyDropProximity)
{
    FakeApi api;
    api.stopLookupsFail = true;
    auto groups = twoGroups();
    std::ostringstream diagnostics;

    auto board = runBoard(api, groups, diagnostics);

    ASSERT_TRUE(board);
    for (auto const& group : *board)
    {
        for (auto const& [name, rows] : group.stops)
        {
            ASSERT_EQ(1u, rows.size()) << name;
            EXPECT_EQ(now + 6min, rows[0].predictedTime());
            EXPECT_FALSE(rows[0].stops());
        }
    }
    EXPECT_TRUE(diagnostics.str().empty());
}
