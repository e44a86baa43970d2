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
#include "rc_connection.hpp"

// local headers
#include "common/rc_error.hpp"
#include "common/utils/string_utils.hpp"

// 3rd party headers
#include <aixlog.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

// standard headers
#include <chrono>
#include <utility>


namespace vlcrc
{

static constexpr auto LOG_TAG = "RcConnection";

using boost::asio::ip::tcp;


RcConnection::RcConnection(ClientSettings::Server server, ClientSettings::Timeout timeout)
    : resolver_(io_context_), socket_(io_context_), buffer_(max_reply_size), server_(std::move(server)), timeout_(timeout)
{
}


RcConnection::~RcConnection()
{
    disconnect();
}


ErrorCode RcConnection::connect()
{
    disconnect();

    boost::system::error_code ec;
    LOG(INFO, LOG_TAG) << "Resolving host IP for: " << server_.host << "\n";
    // blocking, getaddrinfo can not be canceled
    auto endpoints = resolver_.resolve(server_.host, std::to_string(server_.port), boost::asio::ip::resolver_query_base::numeric_service, ec);
    if (ec)
    {
        LOG(ERROR, LOG_TAG) << "Failed to resolve host '" << server_.host << "', error: " << ec.message() << "\n";
        return {RcErrc::connection_failed, "failed to resolve host '" + server_.host + "': " + ec.message()};
    }

    for (const auto& iter : endpoints)
        LOG(DEBUG, LOG_TAG) << "Resolved IP: " << iter.endpoint().address().to_string() << "\n";

    // all endpoints share the connect timeout
    const auto deadline = std::chrono::steady_clock::now() + timeout_.connect;
    ec = boost::asio::error::host_not_found;
    for (const auto& iter : endpoints)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
        {
            ec = boost::asio::error::timed_out;
            break;
        }
        LOG(INFO, LOG_TAG) << "Connecting to host: " << iter.endpoint() << "\n";
        ec = doConnect(iter.endpoint(), remaining);
        if (!ec)
            break;
        LOG(DEBUG, LOG_TAG) << "Failed to connect to " << iter.endpoint() << ", error: " << ec.message() << "\n";
    }

    if (ec)
    {
        LOG(ERROR, LOG_TAG) << "Failed to connect to host '" << server_.address() << "', error: " << ec.message() << "\n";
        disconnect();
        return {RcErrc::connection_failed, server_.address() + ": " + ec.message()};
    }

    // The player greets with its version and a prompt
    auto greeting = readUntilPrompt();
    if (greeting.hasError())
    {
        LOG(ERROR, LOG_TAG) << "No greeting from " << server_.address() << ", error: " << greeting.getError().detailed_message() << "\n";
        disconnect();
        return greeting.takeError();
    }
    LOG(DEBUG, LOG_TAG) << "Greeting: " << greeting.getValue() << "\n";
    LOG(NOTICE, LOG_TAG) << "Connected to " << server_.address() << "\n";
    return {};
}


void RcConnection::disconnect()
{
    buffer_.consume(buffer_.size());
    if (!socket_.is_open())
        return;

    LOG(DEBUG, LOG_TAG) << "Disconnecting\n";
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    if (ec && (ec != boost::asio::error::not_connected))
        LOG(ERROR, LOG_TAG) << "Error in socket shutdown: " << ec.message() << "\n";
    socket_.close(ec);
    if (ec)
        LOG(ERROR, LOG_TAG) << "Error in socket close: " << ec.message() << "\n";
    LOG(DEBUG, LOG_TAG) << "Disconnected\n";
}


bool RcConnection::isConnected() const
{
    return socket_.is_open();
}


bool RcConnection::run(const std::chrono::milliseconds& timeout)
{
    io_context_.restart();
    io_context_.run_for(timeout);
    if (io_context_.stopped())
        return true;

    // Still running: cancel the operation and wait for its handler
    boost::system::error_code ec;
    socket_.close(ec);
    io_context_.run();
    return false;
}


boost::system::error_code RcConnection::doConnect(const tcp::endpoint& endpoint, const std::chrono::milliseconds& timeout)
{
    boost::system::error_code result = boost::asio::error::would_block;
    socket_.async_connect(endpoint, [&result](const boost::system::error_code& ec) { result = ec; });
    if (!run(timeout))
        return boost::asio::error::timed_out;

    if (result)
    {
        // a failed connect leaves the socket open
        boost::system::error_code ec;
        socket_.close(ec);
    }
    return result;
}


ErrorCode RcConnection::send(const std::string& command)
{
    if (!socket_.is_open())
        return {RcErrc::not_connected, "cannot send '" + command + "'"};

    LOG(DEBUG, LOG_TAG) << "Sending: '" << command << "'\n";
    std::string line = command + "\n";
    boost::system::error_code result = boost::asio::error::would_block;
    boost::asio::async_write(socket_, boost::asio::buffer(line), [&result](const boost::system::error_code& ec, std::size_t /*length*/) { result = ec; });
    if (!run(timeout_.write))
    {
        LOG(ERROR, LOG_TAG) << "Timeout while sending '" << command << "'\n";
        disconnect();
        return {RcErrc::timed_out, "sending '" + command + "'"};
    }

    if (result)
    {
        LOG(ERROR, LOG_TAG) << "Failed to send '" << command << "', error: " << result.message() << "\n";
        disconnect();
        return {RcErrc::io_error, "sending '" + command + "': " + result.message()};
    }
    return {};
}


ErrorOr<std::string> RcConnection::readUntil(const std::string& delim)
{
    if (!socket_.is_open())
        return ErrorCode(RcErrc::not_connected);

    boost::system::error_code result = boost::asio::error::would_block;
    std::size_t length = 0;
    boost::asio::async_read_until(socket_, buffer_, delim, [&result, &length](const boost::system::error_code& ec, std::size_t bytes)
    {
        result = ec;
        length = bytes;
    });

    if (!run(timeout_.read))
    {
        LOG(ERROR, LOG_TAG) << "Timeout while waiting for a reply\n";
        disconnect();
        return ErrorCode(RcErrc::timed_out, "waiting for a reply from " + server_.address());
    }

    if (result)
    {
        LOG(ERROR, LOG_TAG) << "Failed to read reply, error: " << result.message() << "\n";
        disconnect();
        return ErrorCode(RcErrc::io_error, "reading reply: " + result.message());
    }

    auto begin = boost::asio::buffers_begin(buffer_.data());
    std::string data(begin, begin + static_cast<std::ptrdiff_t>(length));
    buffer_.consume(length);
    LOG(TRACE, LOG_TAG) << "Received " << length << " bytes: '" << data << "'\n";
    return data;
}


ErrorOr<std::string> RcConnection::readLine()
{
    while (true)
    {
        auto line = readUntil("\n");
        if (line.hasError())
            return line;

        std::string text = line.takeValue();
        // previous replies leave their prompts in front of the line
        utils::string::ltrim(text, std::string(1, PROMPT) + " ");
        utils::string::rtrim(text);
        if (utils::string::starts_with(text, STATUS_CHANGE))
        {
            LOG(DEBUG, LOG_TAG) << "Skipping notification: '" << text << "'\n";
            continue;
        }
        LOG(DEBUG, LOG_TAG) << "Reply: '" << text << "'\n";
        return text;
    }
}


ErrorOr<std::string> RcConnection::readUntilPrompt()
{
    const std::string delim = std::string("\n") + PROMPT;
    while (true)
    {
        auto reply = readUntil(delim);
        if (reply.hasError())
            return reply;

        std::string text = reply.takeValue();
        text.pop_back();
        utils::string::ltrim(text, std::string(1, PROMPT) + " \r\n");
        utils::string::rtrim(text);
        if (text.empty())
            continue;
        return text;
    }
}

} // namespace vlcrc
