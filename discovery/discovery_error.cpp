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
#include "discovery_error.hpp"

// standard headers
#include <string>


namespace vncdiscover::error::discovery
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
    return "discovery";
}

std::string category::message(int value) const
{
    switch (static_cast<DiscoveryErrc>(value))
    {
        case DiscoveryErrc::success:
            return "Success";
        case DiscoveryErrc::browser_not_found:
            return "Browser executable not found";
        case DiscoveryErrc::spawn_failed:
            return "Failed to start browser process";
        case DiscoveryErrc::malformed_record:
            return "Malformed record";
        case DiscoveryErrc::unknown_change_type:
            return "Unknown change type";
        case DiscoveryErrc::invalid_number:
            return "Invalid number";
        case DiscoveryErrc::timeout:
            return "Timeout exceeded";
        case DiscoveryErrc::cleanup_failed:
            return "Failed to terminate browser process";
        default:
            return "Unknown";
    }
}

} // namespace detail

const std::error_category& category()
{
    static detail::category instance;
    return instance;
}

} // namespace vncdiscover::error::discovery

std::error_code make_error_code(DiscoveryErrc errc)
{
    return std::error_code(static_cast<int>(errc), vncdiscover::error::discovery::category());
}
