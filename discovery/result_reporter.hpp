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
#include "session_result.hpp"

// standard headers
#include <ostream>
#include <string>


namespace discovery
{

/// Printed instead of the record list if nothing was found
static constexpr auto NO_HOSTS_FOUND = "No hosts found.";

/// Writes a SessionResult in the user facing format
class ResultReporter
{
public:
    /// c'tor
    explicit ResultReporter(std::ostream& out);

    /// Print one line per record followed by "<n> host(s) found.",
    /// or NO_HOSTS_FOUND if there are no records
    void report(const SessionResult& result);

    /// @return the report for @p result as string
    static std::string format(const SessionResult& result);

private:
    std::ostream& out_;
};

} // namespace discovery
