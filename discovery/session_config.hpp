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
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>


namespace discovery
{

/// Parameters of one bounded browse session
struct SessionConfig
{
    /// browser executable, searched in PATH if it has no '/'
    std::string browser{"dns-sd"};
    /// service type to browse for
    std::string service_type{"_rfb._tcp"};
    /// browse domain
    std::string domain{"local."};
    /// hard upper bound for the session
    std::chrono::milliseconds timeout{500};
    /// number of banner lines printed by the browser before the first data row
    std::size_t header_lines{4};

    /// @return the browser arguments: "-B <service type> <domain>"
    std::vector<std::string> browserArgs() const
    {
        return {"-B", service_type, domain};
    }
};

} // namespace discovery
