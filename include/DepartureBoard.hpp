#pragma once
#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <date/tz.h>
#include "ConfigurationManager.hpp"
#include "DepartureService.hpp"
#include "Types.hpp"

struct GroupRows
{
    std::string title;
    std::vector<std::pair<std::string, std::vector<DepartureRow>>> stops;
};

// One query per configured stop, all running on the same io_context.
// collect() is only meaningful once the io_context has run to completion.
class DepartureBoard
{
private:
    struct StopOutcome
    {
        std::vector<DepartureRow> rows;
        std::exception_ptr error;
    };

    std::vector<BoardGroup> const& groups;
    std::vector<std::vector<StopOutcome>> outcomes;

public:
    explicit DepartureBoard(std::vector<BoardGroup> const& groups);

    void spawn(boost::asio::io_context& io, DepartureService::Fetch fetch, Instant now, date::time_zone const* zone);

    // nullopt if any stop was rate limited. Any other failure is written to
    // `diagnostics` and leaves that stop without rows.
    std::optional<std::vector<GroupRows>> collect(std::ostream& diagnostics);
};
