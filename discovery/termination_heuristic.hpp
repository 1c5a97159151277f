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
#include "discovery_record.hpp"

// standard headers
#include <cstddef>


namespace discovery
{

/// Detects the end of the browser's initial batch of results
/**
 * The browser sets the "more coming" flag on every record of a batch but
 * the last one. There is no explicit end marker, so the first record
 * without the flag ends the batch. Without any record the heuristic
 * never fires.
 */
class TerminationHeuristic
{
public:
    /// c'tor
    TerminationHeuristic() = default;

    /// Feed the next record, after it has been stored
    /// @return true if reading should stop after @p record
    bool observe(const DiscoveryRecord& record);

    /// @return true once a record without "more coming" flag was observed
    bool satisfied() const
    {
        return satisfied_;
    }

    /// @return number of observed records
    std::size_t observed() const
    {
        return observed_;
    }

private:
    std::size_t observed_{0};
    bool satisfied_{false};
};

} // namespace discovery
