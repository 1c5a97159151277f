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
#include <system_error>


enum class DiscoveryErrc
{
    success = 0,

    // The browser executable was not found
    browser_not_found = 1,
    // The browser process could not be started
    spawn_failed = 2,

    // A data line has less than the required number of fields
    malformed_record = 10,
    // The change type field is neither "Add" nor "Rmv"
    unknown_change_type = 11,
    // A numeric field (flags, interface index) is not a number
    invalid_number = 12,

    // No natural end of the browse batch within the configured timeout
    timeout = 20,
    // The browser process could not be terminated
    cleanup_failed = 30
};

namespace vncdiscover::error::discovery
{
const std::error_category& category();
}


namespace std
{
template <>
struct is_error_code_enum<DiscoveryErrc> : public std::true_type
{
};
} // namespace std

std::error_code make_error_code(DiscoveryErrc);
