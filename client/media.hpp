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

#pragma once

// standard headers
#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>


namespace vlcrc
{

/// The minimum amount for a volume setting
static constexpr uint16_t MIN_VOLUME = 0;
/// The maximum amount for a volume setting
static constexpr uint16_t MAX_VOLUME = 200;


/// A media track in the player's playlist
struct Track
{
    /// index of the track in the playlist
    int index{0};
    /// title, commonly the file name
    std::string title;
    /// length as "<hours>:<minutes>:<seconds>"
    std::string length;
    /// the track is the one currently played
    bool current{false};

    /// @return length in seconds
    std::chrono::seconds duration() const;

    /// Parse a line of the "playlist" reply, e.g. "| *8 - Chopin Nocturnes.mp3 (01:50:55) [played 2 times]"
    /// @return the track, or nullopt if @p line does not describe a track
    static std::optional<Track> fromLine(const std::string& line);

    bool operator==(const Track& other) const;
};

/// A subtitle track associated with the current media
struct Subtitle
{
    /// index of the subtitle track, -1 for "Disable"
    int index{0};
    /// name of the subtitle track
    std::string title;

    /// Parse a line of the "strack" reply, e.g. "| 2 - Track 1 - [English]"
    /// @return the subtitle, or nullopt if @p line does not describe a subtitle track
    static std::optional<Subtitle> fromLine(const std::string& line);

    bool operator==(const Subtitle& other) const;
};

/// The tracks of a playlist
using Playlist = std::vector<Track>;
/// The subtitle tracks of a media
using Subtitles = std::vector<Subtitle>;

/// Parse all lines of a "playlist" reply, non-track lines are skipped
Playlist parsePlaylist(const std::string& reply);

/// Parse all lines of a "strack" reply, non-subtitle lines are skipped
Subtitles parseSubtitles(const std::string& reply);

/// "<index> - <title> (<length>)"
std::ostream& operator<<(std::ostream& os, const Track& track);
/// "<index> - <title>"
std::ostream& operator<<(std::ostream& os, const Subtitle& subtitle);

} // namespace vlcrc
