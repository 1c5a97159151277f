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
#include "result_reporter.hpp"

// 3rd party headers
#include <aixlog.hpp>

// standard headers
#include <sstream>


namespace discovery
{

static constexpr auto LOG_TAG = "ResultReporter";


ResultReporter::ResultReporter(std::ostream& out) : out_(out)
{
}


void ResultReporter::report(const SessionResult& result)
{
    LOG(INFO, LOG_TAG) << "Session ended: " << to_string(result.reason) << ", records: " << result.records.size() << "\n";
    if (result.records.empty())
    {
        out_ << NO_HOSTS_FOUND << "\n";
    }
    else
    {
        for (const auto& record : result.records)
            out_ << record << "\n";
        out_ << result.records.size() << " host(s) found.\n";
    }
    out_.flush();
}


std::string ResultReporter::format(const SessionResult& result)
{
    std::stringstream ss;
    ResultReporter(ss).report(result);
    return ss.str();
}

} // namespace discovery
