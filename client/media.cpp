/***
    This file is part of vlcrc
    Copyright (C) 2014-2025  Johannes Pohl

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.
***/

// prototype/interface header file
#include "media.hpp"

// local headers
#include "common/utils/string_utils.hpp"

// 3rd party headers
#include <aixlog.hpp>

// standard headers
#include <regex>
#include <sstream>


namespace vlcrc
{

static constexpr auto LOG_TAG = "Media";

namespace
{
// "| [*]<index> - <title> (<hh:mm:ss>)<anything>", the title is greedy: "Bach (00:00:01).mp3 (01:50:55)"
const std::regex re_track(R"(\|\s+(\*?)(\d+)\s+-\s+(.+)\s\((\d\d:\d\d:\d\d)\).*)");
// "| <index> - <title>"
const std::regex re_subtitle(R"(\|\s+(-?\d+)\s+-\s+(.+))");

std::optional<int> toInt(const std::string& s)
{
    try
    {
        size_t pos = 0;
        int value = std::stoi(s, &pos);
        if (pos != s.size())
            return std::nullopt;
        return value;
    }
    catch (const std::logic_error&)
    {
        return std::nullopt;
    }
}
} // namespace


std::chrono::seconds Track::duration() const
{
    auto parts = utils::string::split(length, ':');
    std::chrono::seconds result{0};
    for (const auto& part : parts)
    {
        auto value = toInt(part);
        if (!value.has_value())
            return std::chrono::seconds{0};
        result = result * 60 + std::chrono::seconds(*value);
    }
    return result;
}


std::optional<Track> Track::fromLine(const std::string& line)
{
    std::string l = utils::string::rtrim_copy(line);
    std::smatch m;
    if (!std::regex_search(l, m, re_track))
        return std::nullopt;

    auto index = toInt(m[2].str());
    if (!index.has_value())
    {
        LOG(DEBUG, LOG_TAG) << "Track index out of range: '" << l << "'\n";
        return std::nullopt;
    }

    Track track;
    track.current = (m[1].length() > 0);
    track.index = *index;
    track.title = m[3].str();
    track.length = m[4].str();
    return track;
}


bool Track::operator==(const Track& other) const
{
    return (index == other.index) && (title == other.title) && (length == other.length) && (current == other.current);
}


std::optional<Subtitle> Subtitle::fromLine(const std::string& line)
{
    std::string l = utils::string::rtrim_copy(line);
    std::smatch m;
    if (!std::regex_search(l, m, re_subtitle))
        return std::nullopt;

    auto index = toInt(m[1].str());
    if (!index.has_value())
    {
        LOG(DEBUG, LOG_TAG) << "Subtitle index out of range: '" << l << "'\n";
        return std::nullopt;
    }

    Subtitle subtitle;
    subtitle.index = *index;
    subtitle.title = m[2].str();
    return subtitle;
}


bool Subtitle::operator==(const Subtitle& other) const
{
    return (index == other.index) && (title == other.title);
}


Playlist parsePlaylist(const std::string& reply)
{
    Playlist playlist;
    std::istringstream is(reply);
    std::string line;
    while (std::getline(is, line))
    {
        if (auto track = Track::fromLine(line))
            playlist.push_back(std::move(*track));
        else
            LOG(TRACE, LOG_TAG) << "Skipping playlist line: '" << utils::string::rtrim_copy(line) << "'\n";
    }
    return playlist;
}


Subtitles parseSubtitles(const std::string& reply)
{
    Subtitles subtitles;
    std::istringstream is(reply);
    std::string line;
    while (std::getline(is, line))
    {
        if (auto subtitle = Subtitle::fromLine(line))
            subtitles.push_back(std::move(*subtitle));
    }
    return subtitles;
}


std::ostream& operator<<(std::ostream& os, const Track& track)
{
    os << track.index << " - " << track.title << " (" << track.length << ")";
    return os;
}


std::ostream& operator<<(std::ostream& os, const Subtitle& subtitle)
{
    os << subtitle.index << " - " << subtitle.title;
    return os;
}

} // namespace vlcrc
