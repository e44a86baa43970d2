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

// local headers
#include "client/rc_client.hpp"
#include "common/rc_error.hpp"
#include "fake_vlc.hpp"

// 3rd party headers
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

// standard headers
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>


using namespace std;
using namespace vlcrc;


namespace
{
/// @return a loopback port without a listener
uint16_t closedPort()
{
    boost::asio::io_context io_context;
    boost::asio::ip::tcp::acceptor acceptor(io_context, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    uint16_t port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}
} // namespace


TEST_CASE("Connect")
{
    FakeVlc vlc;
    Client client(vlc.settings());
    REQUIRE(client.settings().server.address() == "127.0.0.1:" + to_string(vlc.port()));
    REQUIRE(!client.isConnected());
    auto ec = client.connect();
    REQUIRE(!ec);
    REQUIRE(client.isConnected());
    client.disconnect();
    REQUIRE(!client.isConnected());
    // idempotent
    client.disconnect();
}


TEST_CASE("Connection refused")
{
    ClientSettings settings;
    settings.server.port = closedPort();
    Client client(settings);
    auto start = chrono::steady_clock::now();
    auto ec = client.connect();
    REQUIRE(ec == RcErrc::connection_failed);
    REQUIRE(!client.isConnected());
    REQUIRE(chrono::steady_clock::now() - start < settings.timeout.connect + chrono::milliseconds(500));
}


TEST_CASE("Connect timeout")
{
    // not routable: the connect is either rejected or does not complete
    ClientSettings settings;
    settings.server.host = "10.255.255.1";
    settings.timeout.connect = chrono::milliseconds(200);
    Client client(settings);
    auto start = chrono::steady_clock::now();
    REQUIRE(client.connect() == RcErrc::connection_failed);
    REQUIRE(!client.isConnected());
    REQUIRE(chrono::steady_clock::now() - start < settings.timeout.connect + chrono::milliseconds(500));
}


TEST_CASE("Unresolvable host")
{
    ClientSettings settings;
    settings.server.host = "host.invalid";
    Client client(settings);
    REQUIRE(client.connect() == RcErrc::connection_failed);
}


TEST_CASE("No greeting")
{
    FakeVlc::Options options;
    options.send_greeting = false;
    FakeVlc vlc(options);
    auto settings = vlc.settings();
    settings.timeout.read = chrono::milliseconds(200);
    Client client(settings);
    auto ec = client.connect();
    REQUIRE(ec == RcErrc::timed_out);
    REQUIRE(!client.isConnected());
}


TEST_CASE("Not connected")
{
    Client client(ClientSettings{});
    auto volume = client.getVolume();
    REQUIRE(volume.hasError());
    REQUIRE(volume.getError() == RcErrc::not_connected);
    REQUIRE(client.next() == RcErrc::not_connected);
    REQUIRE(client.setVolume(10) == RcErrc::not_connected);
    auto tracks = client.playlist();
    REQUIRE(tracks.hasError());
    REQUIRE(tracks.getError() == RcErrc::not_connected);
}


TEST_CASE("Get volume")
{
    FakeVlc::Options options;

    SECTION("Plain")
    {
        options.volume = 120;
    }

    SECTION("With status change notification")
    {
        options.volume = 120;
        options.notify = true;
    }

    FakeVlc vlc(options);
    Client client(vlc.settings());
    REQUIRE(!client.connect());
    auto volume = client.getVolume();
    REQUIRE(volume.hasValue());
    REQUIRE(volume.getValue() == 120);
}


TEST_CASE("Get volume above maximum")
{
    FakeVlc::Options options;
    options.volume = 256;
    FakeVlc vlc(options);
    Client client(vlc.settings());
    REQUIRE(!client.connect());
    auto volume = client.getVolume();
    REQUIRE(volume.hasValue());
    REQUIRE(volume.getValue() == MAX_VOLUME);
}


TEST_CASE("Get volume with unexpected reply")
{
    FakeVlc::Options options;
    options.volume_reply = "( audio volume: 50 )";
    FakeVlc vlc(options);
    auto settings = vlc.settings();
    settings.convergence.max_attempts = 5;
    Client client(settings);
    REQUIRE(!client.connect());
    auto volume = client.getVolume();
    REQUIRE(volume.hasError());
    REQUIRE(volume.getError() == RcErrc::parse_error);

    // unparsable replies are retried until the budget is exhausted
    REQUIRE(client.setVolume(42) == RcErrc::not_converged);
    REQUIRE(vlc.count("volume 42") == 5);
}


TEST_CASE("Set volume")
{
    SECTION("Delayed")
    {
        FakeVlc::Options options;
        options.volume_lag = 3;
        FakeVlc vlc(options);
        Client client(vlc.settings());
        REQUIRE(!client.connect());
        REQUIRE(!client.setVolume(42));
        REQUIRE(vlc.count("volume 42") == 4);
        auto volume = client.getVolume();
        REQUIRE(volume.hasValue());
        REQUIRE(volume.getValue() == 42);
    }

    SECTION("Whole range")
    {
        FakeVlc::Options options;
        options.volume_lag = 1;
        FakeVlc vlc(options);
        Client client(vlc.settings());
        REQUIRE(!client.connect());
        for (uint16_t amount = MIN_VOLUME; amount <= MAX_VOLUME; ++amount)
        {
            REQUIRE(!client.setVolume(amount));
            auto volume = client.getVolume();
            REQUIRE(volume.hasValue());
            REQUIRE(volume.getValue() == amount);
        }
    }

    SECTION("Clamped")
    {
        FakeVlc vlc;
        Client client(vlc.settings());
        REQUIRE(!client.connect());
        REQUIRE(!client.setVolume(250));
        REQUIRE(vlc.count("volume 250") == 0);
        REQUIRE(vlc.count("volume 200") == 1);
        REQUIRE(client.getVolume().getValue() == MAX_VOLUME);
    }
}


TEST_CASE("Set volume does not converge")
{
    FakeVlc::Options options;
    options.ignore_volume = true;
    FakeVlc vlc(options);
    auto settings = vlc.settings();

    SECTION("Max attempts")
    {
        settings.convergence.max_attempts = 5;
        Client client(settings);
        REQUIRE(!client.connect());
        auto ec = client.setVolume(42);
        REQUIRE(ec == RcErrc::not_converged);
        REQUIRE(ec.detail().find("observed 100") != string::npos);
        REQUIRE(vlc.count("volume 42") == 5);
    }

    SECTION("Deadline")
    {
        settings.convergence.max_attempts = 1000;
        settings.convergence.backoff = chrono::milliseconds(5);
        settings.convergence.deadline = chrono::milliseconds(50);
        Client client(settings);
        REQUIRE(!client.connect());
        REQUIRE(client.setVolume(42) == RcErrc::not_converged);
        REQUIRE(vlc.count("volume 42") < 1000);
    }
}


TEST_CASE("Play and stop")
{
    FakeVlc::Options options;
    options.playing = false;

    SECTION("Immediate")
    {
        options.state_lag = 0;
    }

    SECTION("Delayed")
    {
        options.state_lag = 2;
    }

    FakeVlc vlc(options);
    Client client(vlc.settings());
    REQUIRE(!client.connect());

    auto playing = client.isPlaying();
    REQUIRE(playing.hasValue());
    REQUIRE(!playing.getValue());

    REQUIRE(!client.play());
    REQUIRE(vlc.count("play") == options.state_lag + 1);
    playing = client.isPlaying();
    REQUIRE(playing.hasValue());
    REQUIRE(playing.getValue());

    REQUIRE(!client.stop());
    REQUIRE(vlc.count("stop") == options.state_lag + 1);
    playing = client.isPlaying();
    REQUIRE(playing.hasValue());
    REQUIRE(!playing.getValue());
}


TEST_CASE("Play with empty playlist")
{
    FakeVlc::Options options;
    options.playing = false;
    options.tracks.clear();
    FakeVlc vlc(options);
    Client client(vlc.settings());
    REQUIRE(!client.connect());
    REQUIRE(!client.play());
    REQUIRE(vlc.count("playlist") == 1);
    REQUIRE(vlc.count("play") == 0);
    auto playing = client.isPlaying();
    REQUIRE(playing.hasValue());
    REQUIRE(!playing.getValue());
}


TEST_CASE("Pause")
{
    FakeVlc::Options options;

    SECTION("Playing")
    {
        options.playing = true;
    }

    SECTION("Stopped")
    {
        options.playing = false;
    }

    FakeVlc vlc(options);
    Client client(vlc.settings());
    REQUIRE(!client.connect());
    REQUIRE(!client.pause());
    // a paused track counts as playing
    auto playing = client.isPlaying();
    REQUIRE(playing.hasValue());
    REQUIRE(playing.getValue() == options.playing);
    REQUIRE(vlc.paused() == options.playing);
    REQUIRE(vlc.count("pause") == (options.playing ? 1 : 0));

    // pausing twice keeps the track paused
    REQUIRE(!client.pause());
    REQUIRE(client.isPlaying().hasValue());
    REQUIRE(vlc.paused() == options.playing);
}


TEST_CASE("Seek")
{
    FakeVlc vlc;
    Client client(vlc.settings());
    REQUIRE(!client.connect());

    auto time = client.getTime();
    REQUIRE(time.hasValue());
    REQUIRE(time.getValue() == std::optional<uint32_t>(10));

    REQUIRE(!client.forward(5));
    REQUIRE(vlc.count("seek +5") == 1);
    time = client.getTime();
    REQUIRE(time.hasValue());
    REQUIRE(time.getValue() == std::optional<uint32_t>(15));

    REQUIRE(!client.rewind(20));
    REQUIRE(vlc.count("seek -20") == 1);
    time = client.getTime();
    REQUIRE(time.hasValue());
    REQUIRE(time.getValue() == std::optional<uint32_t>(0));

    REQUIRE(!client.stop());
    time = client.getTime();
    REQUIRE(time.hasValue());
    REQUIRE(!time.getValue().has_value());
}


TEST_CASE("Title")
{
    FakeVlc vlc;
    Client client(vlc.settings());
    REQUIRE(!client.connect());

    auto title = client.getTitle();
    REQUIRE(title.hasValue());
    REQUIRE(title.getValue() == std::optional<std::string>("audio.mp3"));

    REQUIRE(!client.next());
    title = client.getTitle();
    REQUIRE(title.hasValue());
    REQUIRE(title.getValue() == std::optional<std::string>("Bach (00:00:01).mp3"));

    REQUIRE(!client.prev());
    title = client.getTitle();
    REQUIRE(title.hasValue());
    REQUIRE(title.getValue() == std::optional<std::string>("audio.mp3"));

    REQUIRE(!client.stop());
    title = client.getTitle();
    REQUIRE(title.hasValue());
    REQUIRE(!title.getValue().has_value());
}


TEST_CASE("Playlist")
{
    FakeVlc vlc;
    Client client(vlc.settings());
    REQUIRE(!client.connect());

    // leaves its prompt in the stream
    REQUIRE(!client.next());

    auto tracks = client.playlist();
    REQUIRE(tracks.hasValue());
    const auto& playlist = tracks.getValue();
    REQUIRE(playlist.size() == 2);
    REQUIRE(playlist[0] == Track{4, "audio.mp3", "00:03:25", false});
    REQUIRE(playlist[1] == Track{5, "Bach (00:00:01).mp3", "01:50:55", true});
    REQUIRE(playlist[1].duration() == chrono::seconds(6655));

    // the connection is still in sync
    auto volume = client.getVolume();
    REQUIRE(volume.hasValue());
    REQUIRE(volume.getValue() == 100);
}


TEST_CASE("Subtitles")
{
    FakeVlc vlc;
    Client client(vlc.settings());
    REQUIRE(!client.connect());

    auto subtitles = client.subtitles();
    REQUIRE(subtitles.hasValue());
    REQUIRE(subtitles.getValue().size() == 3);
    REQUIRE(subtitles.getValue()[0] == Subtitle{-1, "Disable *"});
    REQUIRE(subtitles.getValue()[1] == Subtitle{2, "Track 1 - [English]"});
    REQUIRE(subtitles.getValue()[2] == Subtitle{3, "Track 2 - [Deutsch]"});
}


TEST_CASE("Unframed list reply")
{
    FakeVlc::Options options;
    options.unframed_reply = "strack: returned -16 (no object)";
    FakeVlc vlc(options);
    Client client(vlc.settings());
    REQUIRE(!client.connect());

    auto start = chrono::steady_clock::now();
    auto subtitles = client.subtitles();
    REQUIRE(subtitles.hasValue());
    REQUIRE(subtitles.getValue().empty());
    auto tracks = client.playlist();
    REQUIRE(tracks.hasValue());
    REQUIRE(tracks.getValue().empty());
    REQUIRE(chrono::steady_clock::now() - start < chrono::milliseconds(500));
    REQUIRE(client.isConnected());

    auto volume = client.getVolume();
    REQUIRE(volume.hasValue());
    REQUIRE(volume.getValue() == 100);
}


TEST_CASE("Player closes the connection")
{
    FakeVlc::Options options;

    SECTION("Query")
    {
        options.close_after = 2;
        FakeVlc vlc(options);
        Client client(vlc.settings());
        REQUIRE(!client.connect());
        auto volume = client.getVolume();
        REQUIRE(volume.hasValue());

        volume = client.getVolume();
        REQUIRE(volume.hasError());
        REQUIRE(volume.getError() == RcErrc::io_error);
        REQUIRE(!client.isConnected());
        REQUIRE(client.next() == RcErrc::not_connected);
    }

    SECTION("Convergence")
    {
        options.close_after = 1;
        FakeVlc vlc(options);
        Client client(vlc.settings());
        REQUIRE(!client.connect());
        auto ec = client.setVolume(42);
        REQUIRE(ec == RcErrc::io_error);
        REQUIRE(!client.isConnected());
        REQUIRE(vlc.count("volume 42") == 1);
    }
}


TEST_CASE("Fullscreen")
{
    FakeVlc vlc;
    Client client(vlc.settings());
    REQUIRE(!client.connect());

    REQUIRE(!client.fullscreen(true));
    // a query waits for the player to process the command
    REQUIRE(client.isPlaying().hasValue());
    REQUIRE(vlc.fullscreen());
    REQUIRE(vlc.count("fullscreen on") == 1);

    REQUIRE(!client.fullscreen(false));
    REQUIRE(client.isPlaying().hasValue());
    REQUIRE(!vlc.fullscreen());
}


namespace
{
/// @return settings for the player in VLCRC_TEST_ADDR, nullopt if not set
std::optional<ClientSettings> liveSettings()
{
    const char* address = std::getenv("VLCRC_TEST_ADDR");
    if (address == nullptr)
        return std::nullopt;
    auto server = ClientSettings::Server::fromAddress(address);
    if (server.hasError())
        return std::nullopt;
    ClientSettings settings;
    settings.server = server.takeValue();
    return settings;
}
} // namespace


// Run against a player started with "vlc --intf rc --rc-host <host>:<port>" and
// VLCRC_TEST_ADDR=<host>:<port>, e.g. "vlcrc_test [live]"
TEST_CASE("Live volume", "[.live]")
{
    auto settings = liveSettings();
    if (!settings)
    {
        WARN("VLCRC_TEST_ADDR not set");
        return;
    }
    Client client(*settings);
    REQUIRE(!client.connect());
    for (uint16_t amount = MIN_VOLUME; amount <= MAX_VOLUME; amount += 10)
    {
        REQUIRE(!client.setVolume(amount));
        auto volume = client.getVolume();
        REQUIRE(volume.hasValue());
        REQUIRE(volume.getValue() == amount);
    }
}


TEST_CASE("Live playback", "[.live]")
{
    auto settings = liveSettings();
    if (!settings)
    {
        WARN("VLCRC_TEST_ADDR not set");
        return;
    }
    Client client(*settings);
    REQUIRE(!client.connect());

    auto tracks = client.playlist();
    REQUIRE(tracks.hasValue());
    REQUIRE(!client.play());
    REQUIRE(!client.stop());
    auto playing = client.isPlaying();
    REQUIRE(playing.hasValue());
    REQUIRE(!playing.getValue());
    REQUIRE(client.subtitles().hasValue());
}
