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
#include "watchdog.hpp"

// 3rd party headers
#include <aixlog.hpp>


static constexpr auto LOG_TAG = "Watchdog";


using namespace std;

namespace discovery
{

Watchdog::Watchdog(const boost::asio::any_io_executor& executor) : timer_(executor)
{
}


Watchdog::~Watchdog()
{
    stop();
}


void Watchdog::start(const std::chrono::milliseconds& timeout, TimeoutHandler&& handler)
{
    LOG(DEBUG, LOG_TAG) << "Starting watchdog, timeout: " << timeout.count() << "ms\n";
    timeout_ms_ = timeout;
    handler_ = std::move(handler);
    expired_ = false;
    timer_.expires_after(timeout_ms_);
    timer_.async_wait(
        [this](const boost::system::error_code& ec)
        {
        if (ec)
            return;
        // stop() raced with an already completed wait
        if (!handler_)
            return;
        LOG(DEBUG, LOG_TAG) << "Timed out: " << timeout_ms_.count() << "ms\n";
        expired_ = true;
        auto handler = std::move(handler_);
        handler_ = nullptr;
        handler(timeout_ms_);
    });
}


void Watchdog::stop()
{
    handler_ = nullptr;
    timer_.cancel();
}

} // namespace discovery
