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

// standard headers
#include <exception>
#include <string>
#include <system_error>


/// vncdiscover specific exceptions
/**
 * Carries a human readable text and, where the failure maps onto one,
 * an error code (e.g. DiscoveryErrc::spawn_failed)
 */
class DiscoverException : public std::exception
{
    std::string text_;
    std::string detail_;
    std::error_code error_code_;

public:
    /// c'tor
    explicit DiscoverException(const std::string& text, std::error_code error_code = {}) : text_(text), error_code_(error_code)
    {
    }

    /// c'tor, the text is "<error message>: <detail>"
    DiscoverException(std::error_code error_code, const std::string& detail)
        : text_(error_code.message() + ": " + detail), detail_(detail), error_code_(error_code)
    {
    }

    /// d'tor
    ~DiscoverException() override = default;

    /// @return error code
    const std::error_code& code() const noexcept
    {
        return error_code_;
    }

    /// @return the detail text, empty if constructed with text only
    const std::string& detail() const noexcept
    {
        return detail_;
    }

    /// @return the exception text
    const char* what() const noexcept override
    {
        return text_.c_str();
    }
};
