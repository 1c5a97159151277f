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


// local headers
#include "common/error_code.hpp"
#include "discovery_record.hpp"
#include "session_config.hpp"

// standard headers
#include <cstddef>
#include <optional>
#include <string>


namespace discovery
{

/// Number of whitespace separated fields in a data row
static constexpr std::size_t RECORD_FIELDS = 7;

/// Classification of one browser output line
enum class ParseStatus
{
    skip,     ///< header line, not inspected
    record,   ///< well-formed data row
    malformed ///< data region line that is not a data row
};

/// Result of parseLine
struct ParseResult
{
    /// the classification
    ParseStatus status{ParseStatus::skip};
    /// the record, set for ParseStatus::record
    std::optional<DiscoveryRecord> record;
    /// why the line is malformed, set for ParseStatus::malformed
    vncdiscover::ErrorCode error;
};

/// Parse line number @p line_index (0-based) of the browser output
/**
 * Lines with an index below config.header_lines are skipped without
 * looking at their content. Data rows have the layout
 * "timestamp A/R flags if domain service-type instance-name", where the
 * instance name is the remainder of the line and may contain spaces.
 */
ParseResult parseLine(const std::string& line, std::size_t line_index, const SessionConfig& config);

/// @return the unsigned number in @p field, or DiscoveryErrc::invalid_number
vncdiscover::ErrorOr<uint32_t> parseNumber(const std::string& field);

} // namespace discovery
