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
#include <sstream>
#include <string>
#include <vector>


namespace utils::string
{

/// trim whitespace from start
std::string& ltrim(std::string& s);

/// trim all characters contained in @p chars from start
std::string& ltrim(std::string& s, const std::string& chars);

/// trim whitespace from end
std::string& rtrim(std::string& s);

/// trim whitespace from both ends
std::string& trim(std::string& s);

/// trim whitespace from start
std::string ltrim_copy(const std::string& s);

/// trim whitespace from end
std::string rtrim_copy(const std::string& s);

/// trim whitespace from both ends
std::string trim_copy(const std::string& s);

/// @return true if @p s starts with @p prefix
bool starts_with(const std::string& s, const std::string& prefix);

/// Split string @p s at the last occurence of @p delim into @p left and @p right
/// If @p delim is not found, @p left is @p s and @p right is empty
void split_right(const std::string& s, char delim, std::string& left, std::string& right);

/// Split string @p s at @p delim and return the splitted list in @p elems
/// @return list of splitted strings
std::vector<std::string>& split(const std::string& s, char delim, std::vector<std::string>& elems);

/// @return resulting list of strings by splitting @p s at @p delim
std::vector<std::string> split(const std::string& s, char delim);

/// @return concatenated values of @p container, separated by @p delim
template <typename T>
std::string container_to_string(const T& container, const std::string& delim = ", ")
{
    std::stringstream ss;
    for (auto iter = container.begin(); iter != container.end(); ++iter)
    {
        ss << *iter;
        if (std::distance(iter, container.end()) > 1)
            ss << delim;
    }
    return ss.str();
}

/// @return @p[in, out] s converted to lowercase
std::string& tolower(std::string& s);

/// @return @p s converted to lowercase
std::string tolower_copy(const std::string& s);


} // namespace utils::string
