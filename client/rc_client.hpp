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

// local headers
#include "client_settings.hpp"
#include "common/error_code.hpp"
#include "media.hpp"
#include "rc_connection.hpp"

// standard headers
#include <cstdint>
#include <optional>
#include <string>


namespace vlcrc
{

/// Remote control of a VLC player via its RC interface
/**
 * Start the player with "vlc --intf rc --rc-host <host>:<port>" (or "--extraintf rc").
 * All methods block until the player replied or the configured timeout expired.
 * Commands changing the playback state or the volume are repeated until the player
 * reports the requested state, bounded by ClientSettings::Convergence.
 * Not thread safe: use one Client per thread.
 */
class Client
{
public:
    /// c'tor
    explicit Client(ClientSettings settings);
    /// d'tor, disconnects
    ~Client();

    /// Connect to the player configured in ClientSettings::server
    ErrorCode connect();
    /// Close the connection
    void disconnect();
    /// @return true if connected
    bool isConnected() const;
    /// @return the settings
    const ClientSettings& settings() const;

    /// @return the tracks in the player's playlist, empty if the reply lists none
    ErrorOr<Playlist> playlist();
    /// @return the subtitle tracks of the current media, empty if no media is loaded
    ErrorOr<Subtitles> subtitles();

    /// @return the current volume, at most MAX_VOLUME
    ErrorOr<uint16_t> getVolume();
    /// Set the volume to @p amount, values above MAX_VOLUME are clamped
    ErrorCode setVolume(uint16_t amount);

    /// @return true if the current track is playing or paused
    ErrorOr<bool> isPlaying();
    /// Start playback, does nothing if the playlist is empty
    ErrorCode play();
    /// Stop playback
    ErrorCode stop();
    /// Pause playback, does nothing if stopped
    ErrorCode pause();

    /// @return seconds elapsed since the start of the track, nullopt if stopped
    ErrorOr<std::optional<uint32_t>> getTime();
    /// Seek forward by @p seconds
    ErrorCode forward(uint32_t seconds);
    /// Seek backward by @p seconds
    ErrorCode rewind(uint32_t seconds);

    /// @return the title of the current track, nullopt if stopped
    ErrorOr<std::optional<std::string>> getTitle();
    /// Play the next track in the playlist
    ErrorCode next();
    /// Play the previous track in the playlist
    ErrorCode prev();
    /// Switch fullscreen mode on or off
    ErrorCode fullscreen(bool on);

private:
    /// Send a command without reply
    ErrorCode sendCommand(const std::string& command);
    /// Send a command with a single line reply
    ErrorOr<std::string> query(const std::string& command);
    /// Send a command with a multi line reply, commonly framed by "+----[ ... ]"
    /// The first reply up to the prompt is returned, except for status change notifications
    ErrorOr<std::string> queryBlock(const std::string& command);

    ClientSettings settings_;
    RcConnection connection_;
};

} // namespace vlcrc
