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
#include "session_result.hpp"


namespace discovery
{

std::string to_string(TerminationReason reason)
{
    switch (reason)
    {
        case TerminationReason::heuristic_satisfied:
            return "heuristic-satisfied";
        case TerminationReason::stream_closed:
            return "stream-closed";
        case TerminationReason::timeout:
            return "timeout";
        case TerminationReason::cancelled:
            return "cancelled";
        case TerminationReason::process_error:
            return "process-error";
    }
    return "unknown";
}

} // namespace discovery
