#include <sstream>
#include "TimeNormalizer.hpp"

std::optional<Instant> TimeNormalizer::parse(std::optional<std::string> const& timestamp)
{
    if (!timestamp || timestamp->empty())
        return std::nullopt;

    std::string text = *timestamp;
    if (text.back() == 'Z' || text.back() == 'z')
        text.replace(text.size() - 1, 1, "+00:00");

    std::istringstream in(text);
    date::sys_time<std::chrono::nanoseconds> parsed;
    in >> date::parse("%FT%T%Ez", parsed);
    if (in.fail())
        return std::nullopt;

    // trailing garbage means it was not a timestamp after all
    if (in.peek() != std::char_traits<char>::eof())
        return std::nullopt;

    return date::floor<std::chrono::seconds>(parsed);
}

std::string TimeNormalizer::formatClock(Instant t, date::time_zone const* zone, bool withSeconds)
{
    auto local = date::make_zoned(zone, t).get_local_time();
    return date::format(withSeconds ? "%H:%M:%S" : "%H:%M", local);
}

std::chrono::minutes TimeNormalizer::minutesBetween(Instant from, Instant to)
{
    return std::chrono::duration_cast<std::chrono::minutes>(to - from);
}
