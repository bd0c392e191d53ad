#pragma once
#include <string>
#include <utility>
#include <vector>
#include <date/tz.h>
#include "Types.hpp"

struct StopDisplay
{
    std::string name;
    std::vector<std::string> times;
};

// Renders groups of stops as fixed-width terminal columns.
//
// The first live row rendered by an instance is shown with seconds precision;
// every later live row, in this or any later group, is not.
class GridFormatter
{
private:
    date::time_zone const* zone;
    bool secondsClaimed = false;

public:
    static constexpr std::size_t COLUMN_WIDTH = 32;
    static constexpr std::size_t MAX_ROWS     = 3;
    static inline const std::string COLUMN_GAP      = "  ";
    static inline const std::string LIVE_GLYPH      = "\U0001F7E2";  // green circle
    static inline const std::string SCHEDULED_GLYPH = "\U0001F4C5";  // calendar
    static inline const std::string NO_TRIPS        = "No upcoming trips";

    explicit GridFormatter(date::time_zone const* zone);

    StopDisplay formatStop(std::string const& name, std::vector<DepartureRow> const& rows, Instant now);

    std::string renderGrid(std::string const& title, std::vector<StopDisplay> const& stops) const;
    std::string renderGrid(std::string const& title,
                           std::vector<std::pair<std::string, std::vector<DepartureRow>>> const& stops,
                           Instant now);

    std::string formatTime(Instant t, Instant now, bool withSeconds = false) const;

    static std::size_t displayWidth(std::string const& text);
    static std::string padToWidth(std::string const& text, std::size_t width);
    static std::vector<std::string> wrapWords(std::string const& text, std::size_t width);
};
