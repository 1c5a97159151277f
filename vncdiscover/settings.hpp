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
#include "discovery/session_config.hpp"

// standard headers
#include <string>


/// vncdiscover settings
struct Settings
{
    /// Log settings
    struct Logging
    {
        /// The log sink (null,system,stdout,stderr,file:<filename>)
        std::string sink{"stderr"};
        /// Log filter
        std::string filter{"*:warning"};
    };

    /// Browse session settings
    discovery::SessionConfig session;
    /// Logging settings
    Logging logging;
};
