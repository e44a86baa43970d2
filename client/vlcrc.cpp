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
#include "client_settings.hpp"
#include "common/utils/string_utils.hpp"
#include "common/version.hpp"
#include "common/vlcrc_exception.hpp"
#include "rc_client.hpp"

// 3rd party headers
#include <aixlog.hpp>
#include <popl.hpp>

// standard headers
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>


using namespace std;
using namespace popl;
using namespace vlcrc;

static constexpr auto LOG_TAG = "vlcrc";

namespace
{

const vector<string> commands{"volume [<0-200>]", "play",        "stop",      "pause",    "next",     "prev",      "forward <sec>",
                              "rewind <sec>",     "time",        "title",     "playing",  "playlist", "subtitles", "fullscreen <on|off>"};


/// @return the command argument at @p index as unsigned number
uint32_t numericArg(const vector<string>& args, size_t index, const string& command)
{
    if (args.size() <= index)
        throw VlcrcException("Missing argument for command \"" + command + "\"");
    const string& arg = args[index];
    if (arg.empty() || (arg.find_first_not_of("0123456789") != string::npos))
        throw VlcrcException("Invalid argument for command \"" + command + "\": " + arg);
    try
    {
        return static_cast<uint32_t>(std::stoul(arg));
    }
    catch (const std::out_of_range&)
    {
        throw VlcrcException("Argument out of range for command \"" + command + "\": " + arg);
    }
}


/// Throw if @p ec is an error
void check(const ErrorCode& ec)
{
    if (ec)
        throw VlcrcException(ec);
}


/// @return the value of @p result, throws on error
template <typename T>
T check(ErrorOr<T>&& result)
{
    if (result.hasError())
        throw VlcrcException(result.getError());
    return result.takeValue();
}


/// Execute @p command with arguments @p args
void execute(Client& client, const string& command, const vector<string>& args)
{
    if (command == "volume")
    {
        if (args.size() > 1)
            check(client.setVolume(static_cast<uint16_t>(std::min<uint32_t>(numericArg(args, 1, command), MAX_VOLUME))));
        else
            cout << check(client.getVolume()) << "\n";
    }
    else if (command == "play")
        check(client.play());
    else if (command == "stop")
        check(client.stop());
    else if (command == "pause")
        check(client.pause());
    else if (command == "next")
        check(client.next());
    else if (command == "prev")
        check(client.prev());
    else if (command == "forward")
        check(client.forward(numericArg(args, 1, command)));
    else if (command == "rewind")
        check(client.rewind(numericArg(args, 1, command)));
    else if (command == "time")
    {
        auto seconds = check(client.getTime());
        if (seconds.has_value())
            cout << *seconds << "\n";
        else
            cout << "stopped\n";
    }
    else if (command == "title")
    {
        auto title = check(client.getTitle());
        if (title.has_value())
            cout << *title << "\n";
        else
            cout << "stopped\n";
    }
    else if (command == "playing")
        cout << (check(client.isPlaying()) ? "1" : "0") << "\n";
    else if (command == "playlist")
    {
        for (const auto& track : check(client.playlist()))
            cout << (track.current ? "* " : "  ") << track << "\n";
    }
    else if (command == "subtitles")
    {
        for (const auto& subtitle : check(client.subtitles()))
            cout << subtitle << "\n";
    }
    else if (command == "fullscreen")
    {
        string mode = (args.size() > 1) ? utils::string::tolower_copy(args[1]) : "";
        if ((mode != "on") && (mode != "off"))
            throw VlcrcException("Command \"fullscreen\" expects \"on\" or \"off\"");
        check(client.fullscreen(mode == "on"));
    }
    else
        throw VlcrcException("Unknown command: " + command);
}

} // namespace


int main(int argc, char** argv)
{
    int exitcode = EXIT_SUCCESS;
    try
    {
        ClientSettings settings;
        size_t timeout_ms = settings.timeout.read.count();
        size_t backoff_ms = settings.convergence.backoff.count();
        size_t deadline_ms = settings.convergence.deadline.count();

        OptionParser op("Usage: vlcrc [options] <command> [argument]\n\nCommands:\n  " + utils::string::container_to_string(commands, "\n  ") +
                        "\n\nAllowed options");
        auto helpSwitch = op.add<Switch>("", "help", "produce help message");
        auto versionSwitch = op.add<Switch>("v", "version", "show version number");
        op.add<Value<string>>("h", "host", "player hostname or ip address", settings.server.host, &settings.server.host);
        op.add<Value<size_t>>("p", "port", "RC port of the player", settings.server.port, &settings.server.port);
        auto addressValue = op.add<Value<string>>("a", "address", "player address <host>:<port>, overrides host and port");
        op.add<Value<size_t>>("", "timeout", "connect, read and write timeout [ms]", timeout_ms, &timeout_ms);
        op.add<Value<size_t>>("", "retries", "max number of attempts to change volume or playback state", settings.convergence.max_attempts,
                              &settings.convergence.max_attempts);
        op.add<Value<size_t>>("", "backoff", "pause before reading back a changed state [ms]", backoff_ms, &backoff_ms);
        op.add<Value<size_t>>("", "deadline", "max duration to change volume or playback state [ms], 0 = unlimited", deadline_ms, &deadline_ms);

        // logging
        op.add<Value<string>>("", "logsink", "log sink [null,system,stdout,stderr,file:<filename>]", settings.logging.sink, &settings.logging.sink);
        auto logfilterOption = op.add<Value<string>>(
            "", "logfilter", "log filter <tag>:<level>[,<tag>:<level>]* with tag = * or <log tag> and level = [trace,debug,info,notice,warning,error,fatal]",
            settings.logging.filter);

        try
        {
            op.parse(argc, argv);
        }
        catch (const std::invalid_argument& e)
        {
            cerr << "Exception: " << e.what() << std::endl;
            cout << "\n" << op << "\n";
            exit(EXIT_FAILURE);
        }

        if (versionSwitch->is_set())
        {
            cout << "vlcrc v" << version::code << (!version::rev().empty() ? (" (rev " + version::rev(8) + ")") : ("")) << "\n"
                 << "License GPLv3+: GNU GPL version 3 or later <http://gnu.org/licenses/gpl.html>.\n"
                 << "This is free software: you are free to change and redistribute it.\n"
                 << "There is NO WARRANTY, to the extent permitted by law.\n\n";
            exit(EXIT_SUCCESS);
        }

        if (helpSwitch->is_set() || op.non_option_args().empty())
        {
            cout << op << "\n";
            exit(helpSwitch->is_set() ? EXIT_SUCCESS : EXIT_FAILURE);
        }

        settings.logging.filter = logfilterOption->value();
        if (logfilterOption->is_set())
        {
            for (size_t n = 1; n < logfilterOption->count(); ++n)
                settings.logging.filter += "," + logfilterOption->value(n);
        }

        AixLog::Filter logfilter;
        auto filters = utils::string::split(settings.logging.filter, ',');
        for (const auto& filter : filters)
            logfilter.add_filter(filter);

        string logformat = "%Y-%m-%d %H-%M-%S.#ms [#severity] (#tag_func)";
        if (settings.logging.sink.find("file:") != string::npos)
        {
            string logfile = settings.logging.sink.substr(settings.logging.sink.find(':') + 1);
            AixLog::Log::init<AixLog::SinkFile>(logfilter, logfile, logformat);
        }
        else if (settings.logging.sink == "stdout")
            AixLog::Log::init<AixLog::SinkCout>(logfilter, logformat);
        else if (settings.logging.sink == "stderr")
            AixLog::Log::init<AixLog::SinkCerr>(logfilter, logformat);
        else if (settings.logging.sink == "system")
            AixLog::Log::init<AixLog::SinkNative>("vlcrc", logfilter);
        else if (settings.logging.sink == "null")
            AixLog::Log::init<AixLog::SinkNull>();
        else
            throw VlcrcException("Invalid log sink: " + settings.logging.sink);

        if (addressValue->is_set())
        {
            auto server = ClientSettings::Server::fromAddress(addressValue->value());
            if (server.hasError())
                throw VlcrcException(server.getError());
            settings.server = server.takeValue();
        }

        settings.timeout.connect = std::chrono::milliseconds(timeout_ms);
        settings.timeout.read = std::chrono::milliseconds(timeout_ms);
        settings.timeout.write = std::chrono::milliseconds(timeout_ms);
        settings.convergence.backoff = std::chrono::milliseconds(backoff_ms);
        settings.convergence.deadline = std::chrono::milliseconds(deadline_ms);

        const vector<string>& args = op.non_option_args();
        LOG(DEBUG, LOG_TAG) << "Version " << version::code << ", command: " << utils::string::container_to_string(args, " ") << "\n";

        Client client(settings);
        LOG(INFO, LOG_TAG) << "Connecting to " << client.settings().server.address() << "\n";
        check(client.connect());
        execute(client, args.front(), args);
    }
    catch (const std::exception& e)
    {
        LOG(ERROR, LOG_TAG) << "Exception: " << e.what() << std::endl;
        cerr << "Error: " << e.what() << "\n";
        exitcode = EXIT_FAILURE;
    }

    exit(exitcode);
}
