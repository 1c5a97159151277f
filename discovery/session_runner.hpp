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
#include "discovery_process.hpp"
#include "session_config.hpp"
#include "session_result.hpp"
#include "termination_heuristic.hpp"
#include "watchdog.hpp"

// 3rd party headers
#include <boost/asio/io_context.hpp>
#include <boost/asio/streambuf.hpp>

// standard headers
#include <cstddef>
#include <functional>
#include <string>
#include <vector>


namespace discovery
{

/// State of a browse session
enum class SessionState
{
    starting,  ///< launching the browser
    streaming, ///< reading browser output
    draining,  ///< terminating the browser
    done       ///< result delivered
};

/// @return name of @p state
std::string to_string(SessionState state);


/// Callback interface for the SessionRunner
class SessionListener
{
public:
    virtual ~SessionListener() = default;

    /// The session moved into @p state
    virtual void onStateChanged(SessionState state) = 0;
    /// @p record has been appended to the result
    virtual void onRecord(const DiscoveryRecord& record) = 0;
    /// The browser has been cleaned up, @p terminated: a running process was killed
    virtual void onCleanup(bool terminated) = 0;
};


/// Bounded browse session
/**
 * Launches the browser, reads its stdout line by line and stops on the
 * first of: end of the browser's batch (TerminationHeuristic), end of
 * stream, watchdog timeout, or cancel(). The browser is terminated exactly
 * once on each of these paths, and the collected records are delivered to
 * the result handler.
 * The runner must outlive the io_context's pending operations, i.e. keep it
 * alive until the result handler has been called.
 */
class SessionRunner
{
public:
    /// Result handler
    using ResultHandler = std::function<void(SessionResult result)>;

    /// c'tor
    SessionRunner(boost::asio::io_context& ioc, SessionConfig config, SessionListener* listener = nullptr);
    /// d'tor
    virtual ~SessionRunner() = default;

    /// Start the session, @p handler is called once with the result
    void start(ResultHandler&& handler);
    /// Stop the session, the result carries TerminationReason::cancelled
    /// If called before start(), start() delivers the cancelled result without launching the browser
    void cancel();

    /// @return the current state
    SessionState state() const
    {
        return state_;
    }

    /// @return pid of the browser, -1 if it has not been started
    int pid() const
    {
        return process_.pid();
    }

    /// Run a session on an own io_context
    /// @return the session result
    static SessionResult run(const SessionConfig& config, SessionListener* listener = nullptr);

private:
    void setState(SessionState state);
    /// Read the next line from the browser
    void readLine();
    /// Handle browser output line
    /// @return true if the session should stop after @p line
    bool onLine(std::string line);
    /// Leave streaming: stop the watchdog, terminate the browser, deliver the result
    void drain(TerminationReason reason, vncdiscover::ErrorCode error = {});

    boost::asio::io_context& ioc_;
    SessionConfig config_;
    SessionListener* listener_;
    DiscoveryProcess process_;
    Watchdog watchdog_;
    TerminationHeuristic heuristic_;
    boost::asio::streambuf streambuf_;
    std::vector<DiscoveryRecord> records_;
    std::size_t line_index_{0};
    SessionState state_{SessionState::starting};
    bool started_{false};
    bool cancel_requested_{false};
    ResultHandler handler_;
};

} // namespace discovery
