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
#include <system_error>


// http://blog.think-async.com/2010/04/system-error-support-in-c0x-part-5.html


/// Failures of the remote control client
enum class RcErrc
{
    success = 0,

    // Address could not be resolved, or no endpoint accepted the connection
    connection_failed = 1,
    // The connection is not open
    not_connected = 2,
    // Read or write on the socket failed, or the player closed the connection
    io_error = 3,
    // Connect, read or write did not complete in time
    timed_out = 4,
    // The player's reply does not match the expected format
    parse_error = 5,
    // The observed state did not match the requested state within the retry budget
    not_converged = 6
};

namespace vlcrc::error::rc
{
const std::error_category& category();
}



namespace std
{
template <>
struct is_error_code_enum<RcErrc> : public std::true_type
{
};
} // namespace std

std::error_code make_error_code(RcErrc);
