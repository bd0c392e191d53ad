#include <sstream>
#include <boost/property_tree/json_parser.hpp>
#include "Errors.hpp"
#include "Parser.hpp"

namespace pt = boost::property_tree;

pt::ptree Parser::readDocument(std::string const& body)
{
    if (body.empty() || body[0] == '<')
        throw DecodeError("response is not JSON");

    std::istringstream in(body);
    pt::ptree doc;
    try
    {
        pt::read_json(in, doc);
    }
    catch (pt::json_parser_error const& e)
    {
        throw DecodeError(e.what());
    }
    return doc;
}

pt::ptree const& Parser::dataArray(pt::ptree const& doc)
{
    auto data = doc.get_child_optional("data");
    if (!data)
        throw DecodeError("missing 'data' member");
    return *data;
}

// The JSON parser keeps null as the text "null".
std::optional<std::string> Parser::optionalText(pt::ptree const& node, std::string const& path)
{
    auto value = node.get_optional<std::string>(path);
    if (!value || value->empty() || *value == "null")
        return std::nullopt;
    return *value;
}

std::string Parser::requiredText(pt::ptree const& node, std::string const& path)
{
    auto value = optionalText(node, path);
    if (!value)
        throw DecodeError("missing '" + path + "'");
    return *value;
}

std::vector<ScheduleRecord> Parser::parseSchedules(std::string const& body)
{
    pt::ptree doc = readDocument(body);

    std::vector<ScheduleRecord> out;
    for (auto const& [key, item] : dataArray(doc))
    {
        ScheduleRecord r;
        r.arrivalTime   = optionalText(item, "attributes.arrival_time");
        r.departureTime = optionalText(item, "attributes.departure_time");
        r.tripId        = requiredText(item, "relationships.trip.data.id");
        out.push_back(std::move(r));
    }
    return out;
}

PredictionBatch Parser::parsePredictions(std::string const& body)
{
    pt::ptree doc = readDocument(body);

    PredictionBatch batch;
    for (auto const& [key, item] : dataArray(doc))
    {
        PredictionRecord r;
        r.arrivalTime   = optionalText(item, "attributes.arrival_time");
        r.departureTime = optionalText(item, "attributes.departure_time");
        r.tripId        = requiredText(item, "relationships.trip.data.id");
        r.vehicleId     = optionalText(item, "relationships.vehicle.data.id");
        r.stopId        = optionalText(item, "relationships.stop.data.id");
        batch.predictions.push_back(std::move(r));
    }

    auto included = doc.get_child_optional("included");
    if (!included)
        return batch;

    for (auto const& [key, inc] : *included)
    {
        auto type = optionalText(inc, "type");
        auto id   = optionalText(inc, "id");
        if (!type || !id)
            continue;

        if (*type == "vehicle")
        {
            if (auto stop = optionalText(inc, "relationships.stop.data.id"))
                batch.vehicles[*id] = *stop;
        }
        else if (*type == "stop")
        {
            batch.parents[*id] = optionalText(inc, "relationships.parent_station.data.id").value_or(*id);
        }
    }

    return batch;
}

StopParentMap Parser::parseStopParents(std::string const& body)
{
    pt::ptree doc = readDocument(body);

    StopParentMap parents;
    for (auto const& [key, item] : dataArray(doc))
    {
        auto id = optionalText(item, "id");
        if (!id)
            continue;
        parents[*id] = optionalText(item, "relationships.parent_station.data.id").value_or(*id);
    }
    return parents;
}

RouteStopSequence Parser::parseRouteStops(std::string const& body)
{
    pt::ptree doc = readDocument(body);

    RouteStopSequence sequence;
    for (auto const& [key, item] : dataArray(doc))
        sequence.push_back(requiredText(item, "id"));
    return sequence;
}
