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

// standard headers
#include <string>
#include <vector>


namespace discovery
{

/// Why a session left the Streaming state
enum class TerminationReason
{
    heuristic_satisfied, ///< end of the browser's batch detected
    stream_closed,       ///< browser output ended
    timeout,             ///< watchdog fired
    cancelled,           ///< cancelled from outside
    process_error        ///< browser could not be started
};

/// @return name of @p reason, e.g. "heuristic-satisfied"
std::string to_string(TerminationReason reason);


/// Outcome of one session
struct SessionResult
{
    /// records in arrival order
    std::vector<DiscoveryRecord> records;
    /// what ended the session
    TerminationReason reason{TerminationReason::process_error};
    /// the spawn error for TerminationReason::process_error, DiscoveryErrc::timeout for TerminationReason::timeout
    vncdiscover::ErrorCode error;
};

} // namespace discovery
