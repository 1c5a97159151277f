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


// prototype/interface header file
#include "string_utils.hpp"

// standard headers
#include <algorithm>
#include <cctype>
#include <sstream>


namespace utils::string
{

namespace
{
bool isSpace(int ch)
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}
} // namespace


// trim from start
std::string& ltrim(std::string& s)
{
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !isSpace(ch); }));
    return s;
}

// trim from end
std::string& rtrim(std::string& s)
{
    s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !isSpace(ch); }).base(), s.end());
    return s;
}

// trim from both ends
std::string& trim(std::string& s)
{
    return ltrim(rtrim(s));
}

// trim from both ends
std::string trim_copy(const std::string& s)
{
    std::string str(s);
    return trim(str);
}


std::vector<std::string>& split(const std::string& s, char delim, std::vector<std::string>& elems)
{
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delim))
    {
        elems.push_back(item);
    }

    if (!s.empty() && (s.back() == delim))
        elems.emplace_back("");

    return elems;
}


std::vector<std::string> split(const std::string& s, char delim)
{
    std::vector<std::string> elems;
    split(s, delim, elems);
    return elems;
}


std::vector<std::string> split_whitespace(const std::string& s, std::size_t max_fields)
{
    std::vector<std::string> fields;
    auto pos = s.begin();
    while (true)
    {
        pos = std::find_if(pos, s.end(), [](int ch) { return !isSpace(ch); });
        if (pos == s.end())
            break;

        if ((max_fields != 0) && (fields.size() + 1 == max_fields))
        {
            std::string rest(pos, s.end());
            fields.push_back(rtrim(rest));
            break;
        }

        auto end = std::find_if(pos, s.end(), isSpace);
        fields.emplace_back(pos, end);
        pos = end;
    }
    return fields;
}


std::string& tolower(std::string& s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}


std::string tolower_copy(const std::string& s)
{
    std::string str(s);
    return tolower(str);
}

} // namespace utils::string
