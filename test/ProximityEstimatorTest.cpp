#include "gtest/gtest.h"

#include "ProximityEstimator.hpp"
#include "StopResolver.hpp"

namespace
{
    RouteStopSequence numberedRoute(int count)
    {
        RouteStopSequence seq;
        for (int i = 0; i < count; ++i)
            seq.push_back("s" + std::to_string(i));
        return seq;
    }
}

TEST(ProximityEstimator, AdjacentStopIsOneAway)
{
    StopResolver stops;
    EXPECT_EQ(1, ProximityEstimator::stopsAway("s3", "s4", stops, numberedRoute(10)));
    EXPECT_EQ(1, ProximityEstimator::stopsAway("s4", "s3", stops, numberedRoute(10)));
}

TEST(ProximityEstimator, SameStopIsUnknown)
{
    StopResolver stops;
    EXPECT_FALSE(ProximityEstimator::stopsAway("s4", "s4", stops, numberedRoute(10)));
}

TEST(ProximityEstimator, BoundIsTwentyInclusive)
{
    StopResolver stops;
    auto route = numberedRoute(30);
    EXPECT_EQ(20, ProximityEstimator::stopsAway("s0", "s20", stops, route));
    EXPECT_FALSE(ProximityEstimator::stopsAway("s0", "s21", stops, route));
}

TEST(ProximityEstimator, ChildStopsResolveToParents)
{
    StopResolver stops({{"70150", "s2"}, {"70158", "s7"}});
    EXPECT_EQ(5, ProximityEstimator::stopsAway("70150", "70158", stops, numberedRoute(10)));
}

TEST(ProximityEstimator, MissingPositionOrRouteIsUnknown)
{
    StopResolver stops;
    EXPECT_FALSE(ProximityEstimator::stopsAway("s1", "elsewhere", stops, numberedRoute(10)));
    EXPECT_FALSE(ProximityEstimator::stopsAway("s1", "s2", stops, {}));
}
