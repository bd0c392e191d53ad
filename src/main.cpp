#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <date/tz.h>
#include "ConfigurationManager.hpp"
#include "DepartureBoard.hpp"
#include "GridFormatter.hpp"
#include "MbtaClient.hpp"
#include "TimeNormalizer.hpp"
#include "Types.hpp"
#include "VirtualClock.hpp"

struct CommandLineOptions
{
    std::string boardPath = ConfigurationManager::DEFAULT_BOARD_PATH;
    std::optional<Instant> at;
    bool help = false;
};

void printUsage(char const* program)
{
    std::cout << "Usage: " << program << " [--config <board.csv>] [--at <RFC-3339 time>]\n"
              << "  --config  board layout (default " << ConfigurationManager::DEFAULT_BOARD_PATH << ")\n"
              << "  --at      render the board as of this instant instead of now\n"
              << "Set MBTA_API_KEY to use an API key.\n";
}

CommandLineOptions parseCommandLineArgs(int argc, char* argv[])
{
    CommandLineOptions options;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            options.boardPath = argv[++i];
        }
        else if (arg == "--at" && i + 1 < argc)
        {
            options.at = TimeNormalizer::parse(std::string(argv[++i]));
            if (!options.at)
                std::cerr << "Warning: ignoring unparsable --at time: " << argv[i] << "\n";
        }
        else if (arg == "--help" || arg == "-h")
        {
            options.help = true;
        }
        else
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
        }
    }

    return options;
}

int main(int argc, char* argv[])
{
    try
    {
        CommandLineOptions options = parseCommandLineArgs(argc, argv);
        if (options.help)
        {
            printUsage(argv[0]);
            return 0;
        }

        if (options.at)
            VirtualClock::set(*options.at);

        ConfigurationManager config(options.boardPath);
        auto const& groups = config.getGroups();

        date::time_zone const* zone = date::current_zone();
        Instant now = VirtualClock::now();

        boost::asio::io_context io;
        MbtaClient client(io, config.getAPIKey());

        DepartureBoard board(groups);
        board.spawn(io,
                    [&client](std::string path, QueryParams params)
                    {
                        return client.get(std::move(path), std::move(params));
                    },
                    now, zone);

        // returns once every stop query has completed
        io.run();

        auto rows = board.collect(std::cerr);
        if (!rows)
        {
            std::cerr << "⚠️  MBTA API rate limit exceeded. Please wait a moment and try again.\n";
            return 1;
        }

        GridFormatter formatter(zone);
        for (auto const& group : *rows)
            std::cout << formatter.renderGrid(group.title + ":", group.stops, now);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
