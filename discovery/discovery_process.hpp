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


// 3rd party headers
#include <boost/asio/io_context.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>

// standard headers
#include <string>
#include <vector>


namespace bp = boost::process;


namespace discovery
{

/// Scoped handle of the browser child process
/**
 * Starts the browser in its own process group with stdout connected to an
 * asynchronous pipe. The process (and its process group) is terminated
 * by the first call to terminate(), at the latest on destruction.
 */
class DiscoveryProcess
{
public:
    /// c'tor
    explicit DiscoveryProcess(boost::asio::io_context& ioc);
    /// d'tor, terminates the process if still running
    ~DiscoveryProcess();

    DiscoveryProcess(const DiscoveryProcess&) = delete;
    DiscoveryProcess& operator=(const DiscoveryProcess&) = delete;

    /// Start @p filename with @p args, throw DiscoverException on error
    void launch(const std::string& filename, const std::vector<std::string>& args);

    /// @return the read end of the child's stdout
    bp::async_pipe& output()
    {
        return pipe_stdout_;
    }

    /// Terminate the process group and close the pipe, only the first call has an effect
    /// @return true if a running process was terminated by this call
    bool terminate();

    /// @return true if the process has been launched
    bool launched() const
    {
        return process_.valid();
    }

    /// @return pid of the process, -1 if not launched
    int pid() const;

    /// @return the executable's complete path to @p filename, empty if not found
    static std::string findExe(const std::string& filename);

private:
    bp::async_pipe pipe_stdout_; ///< stdout of the process
    bp::child process_;          ///< the process
    bool terminated_{false};
};

} // namespace discovery
