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
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <variant>


namespace vlcrc
{

/// Error code with an optional detail text, e.g. the reply that failed to parse
struct ErrorCode : public std::error_code
{
    /// c'tor, no error
    ErrorCode() : std::error_code(), detail_(std::nullopt)
    {
    }

    /// c'tor
    /// @param code the std error code
    ErrorCode(const std::error_code& code) : std::error_code(code), detail_(std::nullopt)
    {
    }

    /// c'tor
    /// @param code the std error code
    /// @param detail additional details
    ErrorCode(const std::error_code& code, std::string detail) : std::error_code(code), detail_(std::move(detail))
    {
    }

    /// Copy c'tor
    ErrorCode(const ErrorCode& other) = default;
    /// Move c'tor
    ErrorCode(ErrorCode&& other) = default;
    /// Copy assignment
    ErrorCode& operator=(const ErrorCode& rhs) = default;
    /// Move assignment
    ErrorCode& operator=(ErrorCode&& rhs) = default;

    /// @return the detail text, empty if there is none
    std::string detail() const
    {
        return detail_.value_or("");
    }

    /// @return error message, followed by the detail text if available
    std::string detailed_message() const
    {
        if (detail_.has_value())
            return message() + ": " + *detail_;
        return message();
    }

private:
    /// Optional error details
    std::optional<std::string> detail_;
};


/// Storage for an ErrorCode or a value of type T
/// Return type of all queries sent to the player
template <class T>
struct ErrorOr
{
    /// Move construct with @p t
    ErrorOr(T&& t) : var(std::move(t))
    {
    }

    /// Construct with @p t
    ErrorOr(const T& t) : var(t)
    {
    }

    /// Move construct with an error
    ErrorOr(ErrorCode&& error) : var(std::move(error))
    {
    }

    /// Construct with an error
    ErrorOr(const ErrorCode& error) : var(error)
    {
    }

    /// @return true if contains a value (i.e. no error)
    bool hasValue() const
    {
        return std::holds_alternative<T>(var);
    }

    /// @return true if contains an error (i.e. no value)
    bool hasError() const
    {
        return std::holds_alternative<ErrorCode>(var);
    }

    /// @return the value
    const T& getValue() const
    {
        return std::get<T>(var);
    }

    /// @return the moved value
    T takeValue()
    {
        return std::move(std::get<T>(var));
    }

    /// @return the error
    const ErrorCode& getError() const
    {
        return std::get<ErrorCode>(var);
    }

    /// @return the moved error
    ErrorCode takeError()
    {
        auto ec = std::move(std::get<ErrorCode>(var));
        return ec;
    }

private:
    /// The stored ErrorCode or value
    std::variant<ErrorCode, T> var;
};


} // namespace vlcrc
