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
#include "discovery_record.hpp"

// local headers
#include "common/utils/string_utils.hpp"

// standard headers
#include <sstream>


namespace discovery
{

std::string to_string(ChangeType change_type)
{
    switch (change_type)
    {
        case ChangeType::added:
            return "Add";
        case ChangeType::removed:
            return "Rmv";
    }
    return "Add";
}


std::optional<ChangeType> change_type_from_string(const std::string& change_type)
{
    std::string lower = utils::string::tolower_copy(change_type);
    if (lower == "add")
        return ChangeType::added;
    if (lower == "rmv")
        return ChangeType::removed;
    return std::nullopt;
}


std::string DiscoveryRecord::toString() const
{
    std::stringstream ss;
    ss << *this;
    return ss.str();
}


bool DiscoveryRecord::operator==(const DiscoveryRecord& other) const
{
    return (timestamp == other.timestamp) && (change_type == other.change_type) && (flags == other.flags) && (interface_index == other.interface_index) &&
           (domain == other.domain) && (service_type == other.service_type) && (instance_name == other.instance_name);
}


std::ostream& operator<<(std::ostream& os, const DiscoveryRecord& record)
{
    os << record.timestamp << " " << to_string(record.change_type) << " " << record.flags << " " << record.interface_index << " " << record.domain << " "
       << record.service_type << " " << record.instance_name;
    return os;
}

} // namespace discovery
