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

#include "rc_error.hpp"

namespace vlcrc::error::rc
{

namespace detail
{

struct category : public std::error_category
{
public:
    const char* name() const noexcept override;
    std::string message(int value) const override;
};


const char* category::name() const noexcept
{
    return "vlcrc";
}

std::string category::message(int value) const
{
    switch (static_cast<RcErrc>(value))
    {
        case RcErrc::success:
            return "Success";
        case RcErrc::connection_failed:
            return "Failed to connect to the player";
        case RcErrc::not_connected:
            return "Not connected";
        case RcErrc::io_error:
            return "I/O error";
        case RcErrc::timed_out:
            return "Timed out";
        case RcErrc::parse_error:
            return "Failed to parse the reply of the player";
        case RcErrc::not_converged:
            return "Player state did not converge";
        default:
            return "Unknown";
    }
}

} // namespace detail

const std::error_category& category()
{
    // The category singleton
    static detail::category instance;
    return instance;
}

} // namespace vlcrc::error::rc

std::error_code make_error_code(RcErrc errc)
{
    return std::error_code(static_cast<int>(errc), vlcrc::error::rc::category());
}
