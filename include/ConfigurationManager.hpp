#pragma once
#include <istream>
#include <string>
#include <vector>
#include "Types.hpp"

struct MonitoredStop
{
    std::string name;
    StopConfig stop;
};

struct BoardGroup
{
    std::string title;
    std::vector<MonitoredStop> stops;
};

class ConfigurationManager
{
private:
    std::string apiKey;
    std::vector<BoardGroup> groups;

    static bool parseFlag(std::string const& text, std::size_t lineNo);
    static int parseDirection(std::string const& text, std::size_t lineNo);

public:
    explicit ConfigurationManager(std::string const& boardPath);

    static inline const std::string MBTA_HOST   = "api-v3.mbta.com";
    static inline const std::string MBTA_PORT   = "443";
    static inline const std::string ACCEPT_TYPE = "application/vnd.api+json";
    static inline const std::string DEFAULT_BOARD_PATH = "data/board.csv";

    static constexpr int SCHEDULE_LOOKBACK_MINUTES = 30;
    static constexpr int SCHEDULE_PAGE_LIMIT       = 20;
    static constexpr int PREDICTION_PAGE_LIMIT     = 3;

    // Header line, then: group,name,route_id,stop_id,direction_id,is_origin
    static std::vector<BoardGroup> parseBoard(std::istream& in);

    [[nodiscard]] std::string getAPIKey() const noexcept;
    [[nodiscard]] std::vector<BoardGroup> const& getGroups() const noexcept;
};
