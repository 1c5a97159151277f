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
#include "termination_heuristic.hpp"

// 3rd party headers
#include <aixlog.hpp>


namespace discovery
{

static constexpr auto LOG_TAG = "Heuristic";


bool TerminationHeuristic::observe(const DiscoveryRecord& record)
{
    ++observed_;
    if (!satisfied_ && !record.moreComing())
    {
        LOG(DEBUG, LOG_TAG) << "End of batch after " << observed_ << " record(s), flags: " << record.flags << "\n";
        satisfied_ = true;
    }
    return satisfied_;
}

} // namespace discovery
