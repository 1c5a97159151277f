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
#include "discovery_process.hpp"

// local headers
#include "common/discover_exception.hpp"
#include "common/utils/string_utils.hpp"
#include "discovery_error.hpp"

// 3rd party headers
#include <aixlog.hpp>
#include <boost/process/args.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/extend.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>

// standard headers
#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>
#include <unistd.h>


using namespace std;

namespace discovery
{

static constexpr auto LOG_TAG = "DiscoveryProcess";


DiscoveryProcess::DiscoveryProcess(boost::asio::io_context& ioc) : pipe_stdout_(ioc)
{
}


DiscoveryProcess::~DiscoveryProcess()
{
    terminate();
}


std::string DiscoveryProcess::findExe(const std::string& filename)
{
    if (filename.empty())
        return "";

    /// relative or absolute path: use as is
    if (filename.find('/') != string::npos)
        return (::access(filename.c_str(), F_OK) == 0) ? filename : "";

    /// plain name: search in PATH
    return bp::search_path(filename).string();
}


void DiscoveryProcess::launch(const std::string& filename, const std::vector<std::string>& args)
{
    string exe = findExe(filename);
    if (exe.empty())
        throw DiscoverException(make_error_code(DiscoveryErrc::browser_not_found), "\"" + filename + "\"");

    string params;
    for (const auto& arg : args)
        params += arg + " ";
    LOG(DEBUG, LOG_TAG) << "Launching: '" << exe << "', with params: '" << utils::string::trim(params) << "'\n";

    try
    {
        // own process group, so that helpers spawned by the browser can be signaled together with it
        process_ = bp::child(bp::exe = exe, bp::args = args, bp::std_out > pipe_stdout_, bp::std_err > bp::null, bp::std_in < bp::null,
                             bp::extend::on_exec_setup = [](auto& /*exec*/) { ::setpgid(0, 0); });
    }
    catch (const bp::process_error& e)
    {
        throw DiscoverException(make_error_code(DiscoveryErrc::spawn_failed), "\"" + exe + "\": " + e.what());
    }
    terminated_ = false;
    LOG(DEBUG, LOG_TAG) << "Started '" << exe << "', pid: " << process_.id() << "\n";
}


int DiscoveryProcess::pid() const
{
    if (!process_.valid())
        return -1;
    return process_.id();
}


bool DiscoveryProcess::terminate()
{
    if (terminated_)
        return false;
    terminated_ = true;

    bool killed = false;
    if (process_.valid())
    {
        auto pid = process_.id();
        std::error_code ec;
        bool running = process_.running(ec);

        // the group id stays reserved while helpers of an exited browser are alive
        LOG(DEBUG, LOG_TAG) << "Terminating process group " << pid << "\n";
        if ((::kill(-pid, SIGTERM) != 0) && (errno != ESRCH))
            LOG(DEBUG, LOG_TAG) << "Failed to signal process group " << pid << ": " << strerror(errno) << "\n";

        if (running)
        {
            process_.terminate(ec);
            if (ec)
                LOG(DEBUG, LOG_TAG) << make_error_code(DiscoveryErrc::cleanup_failed).message() << " (pid " << pid << "): " << ec.message() << "\n";
            else
                killed = true;
        }
        else if (ec)
        {
            LOG(DEBUG, LOG_TAG) << "Failed to query process " << pid << ": " << ec.message() << "\n";
        }
        else
        {
            LOG(DEBUG, LOG_TAG) << "Process " << pid << " already exited, exit code: " << process_.exit_code() << "\n";
        }
    }

    if (pipe_stdout_.is_open())
    {
        boost::system::error_code ec;
        pipe_stdout_.close(ec);
        if (ec)
            LOG(DEBUG, LOG_TAG) << "Failed to close stdout pipe: " << ec.message() << "\n";
    }
    return killed;
}

} // namespace discovery
