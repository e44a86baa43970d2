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

// 3rd party headers
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/streambuf.hpp>

// standard headers
#include <chrono>
#include <string>


namespace vlcrc
{

/// Connection to the player's RC interface
/**
 * Blocking, line based I/O on a TCP socket.
 * Each connect, read and write is bounded by the configured timeout.
 * A failed or timed out operation closes the connection, since the
 * reply stream is out of sync afterwards.
 */
class RcConnection
{
public:
    /// The player prints a prompt when it is ready for the next command
    static constexpr char PROMPT = '>';
    /// Prefix of asynchronous notifications the player interleaves with replies
    static constexpr auto STATUS_CHANGE = "status change:";
    /// Max size of a single reply
    static constexpr size_t max_reply_size = 1024 * 1024;

    /// c'tor
    RcConnection(ClientSettings::Server server, ClientSettings::Timeout timeout);
    /// d'tor, disconnects
    ~RcConnection();

    RcConnection(const RcConnection&) = delete;
    RcConnection& operator=(const RcConnection&) = delete;

    /// Connect to the server and consume its greeting
    /// Connecting to the resolved endpoints takes at most the connect timeout, the greeting
    /// is awaited for the read timeout. Resolving a host name is not bounded, an IP address
    /// is used as is.
    /// @return connection_failed if the host could not be resolved or no endpoint accepted the connection
    ErrorCode connect();
    /// Shutdown and close the socket
    void disconnect();
    /// @return true if the socket is open
    bool isConnected() const;

    /// Send @p command, terminated by a newline
    ErrorCode send(const std::string& command);
    /// Read a single line, with prompt artifacts and trailing whitespace removed
    ErrorOr<std::string> readLine();
    /// Read a multi line reply up to the next prompt
    ErrorOr<std::string> readUntilPrompt();

private:
    /// Connect to @p endpoint within @p timeout
    boost::system::error_code doConnect(const boost::asio::ip::tcp::endpoint& endpoint, const std::chrono::milliseconds& timeout);
    /// Read up to and including @p delim
    ErrorOr<std::string> readUntil(const std::string& delim);
    /// Run the pending async operation for at most @p timeout
    /// @return false if the operation did not complete in time (the socket is closed in this case)
    bool run(const std::chrono::milliseconds& timeout);

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::ip::tcp::socket socket_;
    /// Receive buffer, may hold the beginning of the next reply
    boost::asio::streambuf buffer_;
    ClientSettings::Server server_;
    ClientSettings::Timeout timeout_;
};

} // namespace vlcrc
