#include <algorithm>
#include <sstream>
#include "GridFormatter.hpp"
#include "TimeNormalizer.hpp"

namespace
{
    // Decodes the code point starting at `pos` and advances past it.
    char32_t nextCodePoint(std::string const& text, std::size_t& pos)
    {
        auto lead = static_cast<unsigned char>(text[pos]);
        std::size_t length = 1;
        char32_t cp = lead;

        if      ((lead & 0xE0) == 0xC0) { length = 2; cp = lead & 0x1F; }
        else if ((lead & 0xF0) == 0xE0) { length = 3; cp = lead & 0x0F; }
        else if ((lead & 0xF8) == 0xF0) { length = 4; cp = lead & 0x07; }

        if (pos + length > text.size())
        {
            ++pos;
            return lead;
        }

        for (std::size_t i = 1; i < length; ++i)
            cp = (cp << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3F);

        pos += length;
        return cp;
    }

    // The indicator glyphs render two cells wide in common terminals.
    bool isWideGlyph(char32_t cp)
    {
        return cp == U'\U0001F7E2' || cp == U'\U0001F4C5';
    }
}

GridFormatter::GridFormatter(date::time_zone const* zone)
    : zone(zone)
{
}

std::size_t GridFormatter::displayWidth(std::string const& text)
{
    std::size_t width = 0;
    std::size_t pos = 0;
    while (pos < text.size())
        width += isWideGlyph(nextCodePoint(text, pos)) ? 2 : 1;
    return width;
}

std::string GridFormatter::padToWidth(std::string const& text, std::size_t width)
{
    std::size_t current = displayWidth(text);
    if (current >= width)
        return text;
    return text + std::string(width - current, ' ');
}

std::vector<std::string> GridFormatter::wrapWords(std::string const& text, std::size_t width)
{
    std::vector<std::string> lines;
    std::string current;
    std::istringstream words(text);
    std::string word;

    while (words >> word)
    {
        if (displayWidth(current) + displayWidth(word) + 1 <= width)
        {
            if (!current.empty())
                current += ' ';
            current += word;
        }
        else
        {
            // an overlong first word gets a line of its own instead of an empty one before it
            if (!current.empty())
                lines.push_back(current);
            current = word;
        }
    }

    if (!current.empty())
        lines.push_back(current);

    return lines;
}

std::string GridFormatter::formatTime(Instant t, Instant now, bool withSeconds) const
{
    std::string clock = TimeNormalizer::formatClock(t, zone, withSeconds);
    auto diff = TimeNormalizer::minutesBetween(now, t).count();

    if (diff == 0)
        return clock;

    std::ostringstream ss;
    if (diff < 0)
        ss << clock << " (" << -diff << "m ago)";
    else
        ss << clock << " (in " << diff << "m)";
    return ss.str();
}

StopDisplay GridFormatter::formatStop(std::string const& name, std::vector<DepartureRow> const& rows, Instant now)
{
    StopDisplay display{name, {}};

    for (auto const& row : rows)
    {
        if (display.times.size() >= MAX_ROWS)
            break;

        if (row.predictedTime())
        {
            bool withSeconds = !secondsClaimed;
            secondsClaimed = true;

            std::string text = LIVE_GLYPH + " " + formatTime(*row.predictedTime(), now, withSeconds);
            if (row.stops() && *row.stops() > 0)
            {
                int n = *row.stops();
                text += " (" + std::to_string(n) + " stop" + (n == 1 ? "" : "s") + ")";
            }
            display.times.push_back(std::move(text));
        }
        else if (row.scheduledTime())
        {
            display.times.push_back(SCHEDULED_GLYPH + " " + formatTime(*row.scheduledTime(), now));
        }
    }

    if (display.times.empty())
        display.times.push_back(NO_TRIPS);

    return display;
}

std::string GridFormatter::renderGrid(std::string const& title, std::vector<StopDisplay> const& stops) const
{
    std::ostringstream ss;
    ss << title << "\n";

    std::vector<std::vector<std::string>> names;
    names.reserve(stops.size());
    std::size_t nameLines = 0;
    std::size_t timeLines = 0;

    for (auto const& stop : stops)
    {
        names.push_back(wrapWords(stop.name, COLUMN_WIDTH));
        nameLines = std::max(nameLines, names.back().size());
        timeLines = std::max(timeLines, stop.times.size());
    }

    for (std::size_t line = 0; line < nameLines; ++line)
    {
        for (auto const& wrapped : names)
            ss << padToWidth(line < wrapped.size() ? wrapped[line] : "", COLUMN_WIDTH) << COLUMN_GAP;
        ss << "\n";
    }

    for (std::size_t line = 0; line < timeLines; ++line)
    {
        for (auto const& stop : stops)
            ss << padToWidth(line < stop.times.size() ? stop.times[line] : "", COLUMN_WIDTH) << COLUMN_GAP;
        ss << "\n";
    }

    ss << "\n";
    return ss.str();
}

std::string GridFormatter::renderGrid(std::string const& title,
                                      std::vector<std::pair<std::string, std::vector<DepartureRow>>> const& stops,
                                      Instant now)
{
    std::vector<StopDisplay> displays;
    displays.reserve(stops.size());
    for (auto const& [name, rows] : stops)
        displays.push_back(formatStop(name, rows, now));

    return renderGrid(title, displays);
}
