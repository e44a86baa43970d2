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
#include "client_settings.hpp"

// local headers
#include "common/rc_error.hpp"
#include "common/utils/string_utils.hpp"

// standard headers
#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>


namespace vlcrc
{

std::string ClientSettings::Server::address() const
{
    if (host.find(':') != std::string::npos)
        return "[" + host + "]:" + std::to_string(port);
    return host + ":" + std::to_string(port);
}


ErrorOr<ClientSettings::Server> ClientSettings::Server::fromAddress(const std::string& address)
{
    Server server;
    std::string addr = utils::string::trim_copy(address);
    std::string port;
    if (!addr.empty() && (addr.front() == '['))
    {
        auto end = addr.find(']');
        if (end == std::string::npos)
            return ErrorCode(RcErrc::parse_error, "missing ']' in address \"" + address + "\"");
        server.host = addr.substr(1, end - 1);
        std::string rest = addr.substr(end + 1);
        if (!rest.empty())
        {
            if (rest.front() != ':')
                return ErrorCode(RcErrc::parse_error, "expected ':' after ']' in address \"" + address + "\"");
            port = rest.substr(1);
        }
    }
    else if (std::count(addr.begin(), addr.end(), ':') > 1)
    {
        // bare IPv6 address, no port
        server.host = addr;
    }
    else
    {
        utils::string::split_right(addr, ':', server.host, port);
        if ((addr.find(':') != std::string::npos) && port.empty())
            return ErrorCode(RcErrc::parse_error, "missing port in address \"" + address + "\"");
    }

    if (server.host.empty())
        return ErrorCode(RcErrc::parse_error, "missing host in address \"" + address + "\"");

    if (!port.empty())
    {
        if (port.find_first_not_of("0123456789") != std::string::npos)
            return ErrorCode(RcErrc::parse_error, "invalid port \"" + port + "\"");
        try
        {
            unsigned long value = std::stoul(port);
            if ((value == 0) || (value > std::numeric_limits<uint16_t>::max()))
                return ErrorCode(RcErrc::parse_error, "port out of range: " + port);
            server.port = value;
        }
        catch (const std::out_of_range&)
        {
            return ErrorCode(RcErrc::parse_error, "port out of range: " + port);
        }
    }
    return server;
}

} // namespace vlcrc
