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
#include "record_parser.hpp"

// local headers
#include "common/utils/string_utils.hpp"
#include "discovery_error.hpp"

// standard headers
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <vector>


namespace discovery
{

namespace
{
ParseResult malformed(DiscoveryErrc errc, const std::string& detail)
{
    ParseResult result;
    result.status = ParseStatus::malformed;
    result.error = vncdiscover::ErrorCode(make_error_code(errc), detail);
    return result;
}
} // namespace


vncdiscover::ErrorOr<uint32_t> parseNumber(const std::string& field)
{
    if (field.empty() || !std::all_of(field.begin(), field.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
        return vncdiscover::ErrorCode(make_error_code(DiscoveryErrc::invalid_number), "'" + field + "'");

    try
    {
        unsigned long value = std::stoul(field);
        if (value > std::numeric_limits<uint32_t>::max())
            throw std::out_of_range(field);
        return static_cast<uint32_t>(value);
    }
    catch (const std::out_of_range&)
    {
        return vncdiscover::ErrorCode(make_error_code(DiscoveryErrc::invalid_number), "'" + field + "' out of range");
    }
}


ParseResult parseLine(const std::string& line, std::size_t line_index, const SessionConfig& config)
{
    if (line_index < config.header_lines)
        return ParseResult{};

    std::string data = line;
    if (!data.empty() && (data.back() == '\r'))
        data.pop_back();

    std::vector<std::string> fields = utils::string::split_whitespace(data, RECORD_FIELDS);
    if (fields.size() < RECORD_FIELDS)
        return malformed(DiscoveryErrc::malformed_record, std::to_string(fields.size()) + " fields in '" + data + "'");

    auto change_type = change_type_from_string(fields[1]);
    if (!change_type.has_value())
        return malformed(DiscoveryErrc::unknown_change_type, "'" + fields[1] + "'");

    auto flags = parseNumber(fields[2]);
    if (flags.hasError())
        return malformed(DiscoveryErrc::invalid_number, "flags " + flags.getError().detail());

    auto interface_index = parseNumber(fields[3]);
    if (interface_index.hasError())
        return malformed(DiscoveryErrc::invalid_number, "interface " + interface_index.getError().detail());

    DiscoveryRecord record;
    record.timestamp = fields[0];
    record.change_type = *change_type;
    record.flags = flags.getValue();
    record.interface_index = interface_index.getValue();
    record.domain = fields[4];
    record.service_type = fields[5];
    record.instance_name = fields[6];

    ParseResult result;
    result.status = ParseStatus::record;
    result.record = std::move(record);
    return result;
}

} // namespace discovery
