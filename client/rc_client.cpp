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
#include "rc_client.hpp"

// local headers
#include "common/rc_error.hpp"
#include "common/utils/string_utils.hpp"
#include "convergence.hpp"

// 3rd party headers
#include <aixlog.hpp>

// standard headers
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>


namespace vlcrc
{

static constexpr auto LOG_TAG = "Client";

/// Frame of multi line replies, e.g. "+----[ Playlist - playlist ]"
static constexpr auto FRAME_MARKER = "+----[";

namespace
{
/// @return true if every line of @p reply is a status change notification
bool isNotification(const std::string& reply)
{
    auto lines = utils::string::split(reply, '\n');
    return std::all_of(lines.begin(), lines.end(), [](std::string line)
    {
        utils::string::ltrim(line, std::string(1, RcConnection::PROMPT) + " ");
        return utils::string::starts_with(utils::string::trim(line), RcConnection::STATUS_CHANGE);
    });
}


/// @return the unsigned value of @p text, nullopt if it is not a number
std::optional<unsigned long> toUnsigned(const std::string& text)
{
    if (text.empty() || (text.find_first_not_of("0123456789") != std::string::npos))
        return std::nullopt;
    try
    {
        return std::stoul(text);
    }
    catch (const std::out_of_range&)
    {
        return std::nullopt;
    }
}
} // namespace


Client::Client(ClientSettings settings) : settings_(std::move(settings)), connection_(settings_.server, settings_.timeout)
{
}


Client::~Client()
{
    disconnect();
}


ErrorCode Client::connect()
{
    return connection_.connect();
}


void Client::disconnect()
{
    connection_.disconnect();
}


bool Client::isConnected() const
{
    return connection_.isConnected();
}


const ClientSettings& Client::settings() const
{
    return settings_;
}


ErrorCode Client::sendCommand(const std::string& command)
{
    return connection_.send(command);
}


ErrorOr<std::string> Client::query(const std::string& command)
{
    if (auto ec = connection_.send(command); ec)
        return ec;
    return connection_.readLine();
}


ErrorOr<std::string> Client::queryBlock(const std::string& command)
{
    if (auto ec = connection_.send(command); ec)
        return ec;

    while (true)
    {
        auto reply = connection_.readUntilPrompt();
        if (reply.hasError())
            return reply;

        const std::string& text = reply.getValue();
        if (isNotification(text))
        {
            LOG(DEBUG, LOG_TAG) << "Skipping notification: '" << text << "'\n";
            continue;
        }
        // e.g. "strack: returned -16 (no object)" without media
        if (text.find(FRAME_MARKER) == std::string::npos)
            LOG(WARNING, LOG_TAG) << "Unframed reply to '" << command << "': '" << text << "'\n";
        return reply;
    }
}


ErrorOr<Playlist> Client::playlist()
{
    auto reply = queryBlock("playlist");
    if (reply.hasError())
        return reply.takeError();
    return parsePlaylist(reply.getValue());
}


ErrorOr<Subtitles> Client::subtitles()
{
    auto reply = queryBlock("strack");
    if (reply.hasError())
        return reply.takeError();
    return parseSubtitles(reply.getValue());
}


ErrorOr<uint16_t> Client::getVolume()
{
    auto reply = query("volume");
    if (reply.hasError())
        return reply.takeError();

    auto volume = toUnsigned(reply.getValue());
    if (!volume.has_value())
        return ErrorCode(RcErrc::parse_error, "volume: '" + reply.getValue() + "'");
    return static_cast<uint16_t>(std::min<unsigned long>(*volume, MAX_VOLUME));
}


ErrorCode Client::setVolume(uint16_t amount)
{
    amount = std::min(amount, MAX_VOLUME);
    LOG(INFO, LOG_TAG) << "Setting volume to " << amount << "\n";
    return converge(
        settings_.convergence, "volume " + std::to_string(amount), [this, amount] { return sendCommand("volume " + std::to_string(amount)); },
        [this] { return getVolume(); }, [amount](uint16_t volume) { return volume == amount; });
}


ErrorOr<bool> Client::isPlaying()
{
    auto reply = query("is_playing");
    if (reply.hasError())
        return reply.takeError();

    const std::string& playing = reply.getValue();
    if (playing == "1")
        return true;
    if (playing == "0")
        return false;
    return ErrorCode(RcErrc::parse_error, "is_playing: '" + playing + "'");
}


ErrorCode Client::play()
{
    auto tracks = playlist();
    if (tracks.hasError())
        return tracks.takeError();

    if (tracks.getValue().empty())
    {
        LOG(INFO, LOG_TAG) << "Playlist is empty, not starting playback\n";
        return {};
    }

    LOG(INFO, LOG_TAG) << "Starting playback\n";
    return converge(
        settings_.convergence, "play", [this] { return sendCommand("play"); }, [this] { return isPlaying(); }, [](bool playing) { return playing; });
}


ErrorCode Client::stop()
{
    LOG(INFO, LOG_TAG) << "Stopping playback\n";
    return converge(
        settings_.convergence, "stop", [this] { return sendCommand("stop"); }, [this] { return isPlaying(); }, [](bool playing) { return !playing; });
}


ErrorCode Client::pause()
{
    auto playing = isPlaying();
    if (playing.hasError())
        return playing.takeError();

    if (!playing.getValue())
    {
        LOG(DEBUG, LOG_TAG) << "Not playing, nothing to pause\n";
        return {};
    }

    // "pause" toggles, "play" resumes a paused track: the sequence always ends paused
    if (auto ec = sendCommand("play"); ec)
        return ec;
    return sendCommand("pause");
}


ErrorOr<std::optional<uint32_t>> Client::getTime()
{
    auto reply = query("get_time");
    if (reply.hasError())
        return reply.takeError();

    // empty if stopped
    if (reply.getValue().empty())
        return std::optional<uint32_t>();

    auto seconds = toUnsigned(reply.getValue());
    if (!seconds.has_value() || (*seconds > std::numeric_limits<uint32_t>::max()))
        return ErrorCode(RcErrc::parse_error, "get_time: '" + reply.getValue() + "'");
    return std::optional<uint32_t>(static_cast<uint32_t>(*seconds));
}


ErrorCode Client::forward(uint32_t seconds)
{
    return sendCommand("seek +" + std::to_string(seconds));
}


ErrorCode Client::rewind(uint32_t seconds)
{
    return sendCommand("seek -" + std::to_string(seconds));
}


ErrorOr<std::optional<std::string>> Client::getTitle()
{
    auto reply = query("get_title");
    if (reply.hasError())
        return reply.takeError();

    // empty if stopped
    std::string title = reply.takeValue();
    if (title.empty())
        return std::optional<std::string>();
    return std::optional<std::string>(std::move(title));
}


ErrorCode Client::next()
{
    return sendCommand("next");
}


ErrorCode Client::prev()
{
    return sendCommand("prev");
}


ErrorCode Client::fullscreen(bool on)
{
    return sendCommand(std::string("fullscreen ") + (on ? "on" : "off"));
}

} // namespace vlcrc
