#pragma once
#include <optional>
#include <string>
#include <vector>
#include <boost/property_tree/ptree.hpp>
#include "Types.hpp"

// Decodes MBTA v3 JSON:API bodies. Throws DecodeError on malformed documents.
class Parser
{
public:
    static std::vector<ScheduleRecord> parseSchedules(std::string const& body);
    static PredictionBatch parsePredictions(std::string const& body);
    static StopParentMap parseStopParents(std::string const& body);
    static RouteStopSequence parseRouteStops(std::string const& body);

private:
    static boost::property_tree::ptree readDocument(std::string const& body);
    static boost::property_tree::ptree const& dataArray(boost::property_tree::ptree const& doc);
    static std::optional<std::string> optionalText(boost::property_tree::ptree const& node, std::string const& path);
    static std::string requiredText(boost::property_tree::ptree const& node, std::string const& path);
};
