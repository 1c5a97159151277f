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
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>


namespace discovery
{

/// dns-sd "kDNSServiceFlagsMoreComing": more results are queued
static constexpr uint32_t FLAG_MORE_COMING = 0x1;

/// Service instance appeared or disappeared
enum class ChangeType
{
    added,  ///< "Add"
    removed ///< "Rmv"
};

/// @return "Add" or "Rmv"
std::string to_string(ChangeType change_type);

/// @return the ChangeType for "Add" or "Rmv" (case insensitive), nullopt else
std::optional<ChangeType> change_type_from_string(const std::string& change_type);


/// One service instance, as reported by a "dns-sd -B" data row
struct DiscoveryRecord
{
    /// timestamp column, as printed by the browser
    std::string timestamp;
    /// A/R column
    ChangeType change_type{ChangeType::added};
    /// Flags column
    uint32_t flags{0};
    /// if column, opaque
    uint32_t interface_index{0};
    /// Domain column
    std::string domain;
    /// Service Type column
    std::string service_type;
    /// Instance Name column, may contain spaces
    std::string instance_name;

    /// @return true if the browser announced more records of the current batch
    bool moreComing() const
    {
        return (flags & FLAG_MORE_COMING) != 0;
    }

    /// @return the fields, separated by a single space
    std::string toString() const;

    bool operator==(const DiscoveryRecord& other) const;
};

std::ostream& operator<<(std::ostream& os, const DiscoveryRecord& record);

} // namespace discovery
