#include <boost/asio/co_spawn.hpp>
#include "DepartureBoard.hpp"
#include "Errors.hpp"

DepartureBoard::DepartureBoard(std::vector<BoardGroup> const& groups)
    : groups(groups)
{
    outcomes.resize(groups.size());
    for (std::size_t g = 0; g < groups.size(); ++g)
        outcomes[g].resize(groups[g].stops.size());
}

void DepartureBoard::spawn(boost::asio::io_context& io, DepartureService::Fetch fetch, Instant now, date::time_zone const* zone)
{
    for (std::size_t g = 0; g < groups.size(); ++g)
    {
        for (std::size_t s = 0; s < groups[g].stops.size(); ++s)
        {
            StopOutcome& slot = outcomes[g][s];
            boost::asio::co_spawn(io,
                DepartureService::computeDepartureRows(fetch, groups[g].stops[s].stop, now, zone),
                [&slot](std::exception_ptr e, std::vector<DepartureRow> rows)
                {
                    slot.error = e;
                    slot.rows  = std::move(rows);
                });
        }
    }
}

std::optional<std::vector<GroupRows>> DepartureBoard::collect(std::ostream& diagnostics)
{
    bool rateLimited = false;
    std::vector<GroupRows> board;
    board.reserve(groups.size());

    for (std::size_t g = 0; g < groups.size(); ++g)
    {
        GroupRows group{groups[g].title, {}};

        for (std::size_t s = 0; s < groups[g].stops.size(); ++s)
        {
            StopOutcome& outcome = outcomes[g][s];
            std::string const& name = groups[g].stops[s].name;

            if (outcome.error)
            {
                try
                {
                    std::rethrow_exception(outcome.error);
                }
                catch (RateLimitedError const&)
                {
                    rateLimited = true;
                }
                catch (std::exception const& e)
                {
                    diagnostics << "⚠️  Error fetching " << name << " data: " << e.what() << "\n";
                }
                outcome.rows.clear();
            }

            group.stops.emplace_back(name, std::move(outcome.rows));
        }

        board.push_back(std::move(group));
    }

    if (rateLimited)
        return std::nullopt;

    return board;
}
