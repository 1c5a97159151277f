/***
    This file is part of vncdiscover
    Copyright (C) 2026  The vncdiscover authors

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
#include <cstddef>
#include <string>
#include <vector>


namespace utils::string
{

/// trim from start
std::string& ltrim(std::string& s);

/// trim from end
std::string& rtrim(std::string& s);

/// trim from both ends
std::string& trim(std::string& s);

/// trim from both ends
std::string trim_copy(const std::string& s);

/// Split string @p s at @p delim and return the splitted list in @p elems
/// @return list of splitted strings
std::vector<std::string>& split(const std::string& s, char delim, std::vector<std::string>& elems);

/// @return resulting list of strings by splitting @p s at @p delim
std::vector<std::string> split(const std::string& s, char delim);

/// Split @p s at runs of whitespace into at most @p max_fields fields
/**
 * Leading and trailing whitespace is ignored. If @p s has more fields than
 * @p max_fields, the last field holds the (trimmed) remainder of @p s,
 * including its inner whitespace. @p max_fields = 0 means no limit.
 */
std::vector<std::string> split_whitespace(const std::string& s, std::size_t max_fields = 0);

/// @return @p[in, out] s converted to lowercase
std::string& tolower(std::string& s);

/// @return @p s converted to lowercase
std::string tolower_copy(const std::string& s);

} // namespace utils::string
