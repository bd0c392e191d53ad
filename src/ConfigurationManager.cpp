#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include "ConfigurationManager.hpp"
#include "Errors.hpp"

namespace
{
    std::string trim(std::string const& s)
    {
        auto first = s.find_first_not_of(" \t\r");
        if (first == std::string::npos)
            return {};
        auto last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }
}

ConfigurationManager::ConfigurationManager(std::string const& boardPath)
{
    // the API works without a key, just with a lower rate limit
    const char* envAPIKey = std::getenv("MBTA_API_KEY");
    if (envAPIKey)
        apiKey = envAPIKey;

    std::ifstream file(boardPath);
    if (!file.is_open())
        throw ConfigError("Could not open board file " + boardPath);

    groups = parseBoard(file);
    if (groups.empty())
        throw ConfigError("Board file " + boardPath + " lists no stops");

    std::size_t stopCount = 0;
    for (auto const& g : groups)
        stopCount += g.stops.size();

    std::cerr << "[Config] Loaded " << stopCount << " stops in "
              << groups.size() << " groups from " << boardPath << "\n";
}

bool ConfigurationManager::parseFlag(std::string const& text, std::size_t lineNo)
{
    if (text == "1" || text == "true")  return true;
    if (text == "0" || text == "false") return false;
    throw ConfigError("line " + std::to_string(lineNo) + ": is_origin must be 0/1/true/false, got '" + text + "'");
}

int ConfigurationManager::parseDirection(std::string const& text, std::size_t lineNo)
{
    if (text == "0") return 0;
    if (text == "1") return 1;
    throw ConfigError("line " + std::to_string(lineNo) + ": direction_id must be 0 or 1, got '" + text + "'");
}

std::vector<BoardGroup> ConfigurationManager::parseBoard(std::istream& in)
{
    std::vector<BoardGroup> out;
    std::string line;
    std::getline(in, line);
    std::size_t lineNo = 1;

    while (std::getline(in, line))
    {
        ++lineNo;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, ','))
            fields.push_back(trim(field));

        if (fields.size() != 6)
            throw ConfigError("line " + std::to_string(lineNo) + ": expected 6 columns, got " + std::to_string(fields.size()));

        MonitoredStop entry;
        entry.name             = fields[1];
        entry.stop.routeId     = fields[2];
        entry.stop.stopId      = fields[3];
        entry.stop.directionId = parseDirection(fields[4], lineNo);
        entry.stop.isOrigin    = parseFlag(fields[5], lineNo);

        if (entry.stop.routeId.empty() || entry.stop.stopId.empty())
            throw ConfigError("line " + std::to_string(lineNo) + ": route_id and stop_id are required");

        auto it = std::find_if(out.begin(), out.end(),
                               [&](BoardGroup const& g) { return g.title == fields[0]; });
        if (it == out.end())
        {
            out.push_back(BoardGroup{fields[0], {}});
            it = std::prev(out.end());
        }
        it->stops.push_back(std::move(entry));
    }

    return out;
}

std::string ConfigurationManager::getAPIKey() const noexcept { return apiKey; }
std::vector<BoardGroup> const& ConfigurationManager::getGroups() const noexcept { return groups; }
