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
#include "common/error_code.hpp"

// standard headers
#include <chrono>
#include <cstddef>
#include <string>


namespace vlcrc
{

/// Remote control client settings
struct ClientSettings
{
    /// Address of the player's RC interface
    struct Server
    {
        /// player host or IP address
        std::string host{"127.0.0.1"};
        /// RC port, as passed to the player with "--rc-host"
        size_t port{9090};

        /// @return "<host>:<port>", IPv6 addresses in brackets
        std::string address() const;

        /// Parse "<host>:<port>", "[<ipv6>]:<port>" or "<host>" (default port)
        static ErrorOr<Server> fromAddress(const std::string& address);
    };

    /// Socket timeouts
    struct Timeout
    {
        /// max duration to establish the connection
        std::chrono::milliseconds connect{1000};
        /// max duration to wait for a reply
        std::chrono::milliseconds read{1000};
        /// max duration to write a command
        std::chrono::milliseconds write{1000};
    };

    /// Budget for polling the player until it reports a requested state
    struct Convergence
    {
        /// max number of times the state changing command is issued
        size_t max_attempts{100};
        /// pause between issuing the command and reading the state back
        std::chrono::milliseconds backoff{10};
        /// overall time budget, 0 = unlimited (max_attempts still applies)
        std::chrono::milliseconds deadline{0};
    };

    /// Log settings
    struct Logging
    {
        /// The log sink (null,system,stdout,stderr,file:<filename>)
        std::string sink{"stderr"};
        /// Log filter
        std::string filter{"*:warning"};
    };

    /// Server settings
    Server server;
    /// Timeout settings
    Timeout timeout;
    /// Convergence settings
    Convergence convergence;
    /// Logging settings
    Logging logging;
};

} // namespace vlcrc
