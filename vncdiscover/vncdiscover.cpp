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

// local headers
#include "common/discover_exception.hpp"
#include "common/utils/string_utils.hpp"
#include "common/version.hpp"
#include "discovery/result_reporter.hpp"
#include "discovery/session_runner.hpp"
#include "settings.hpp"

// 3rd party headers
#include <aixlog.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <popl.hpp>

// standard headers
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>


using namespace std;
using namespace popl;

static constexpr auto LOG_TAG = "vncdiscover";

/// exit code if the browser could not be started
static constexpr int EXIT_SPAWN_FAILURE = 2;


int main(int argc, char* argv[])
{
    int exitcode = EXIT_SUCCESS;
    try
    {
        // log to stderr until the configured sink is known
        AixLog::Log::init<AixLog::SinkCerr>(AixLog::Severity::warning);

        Settings settings;
        std::string config_file = "/etc/vncdiscover.conf";
        size_t timeout_ms = static_cast<size_t>(settings.session.timeout.count());

        OptionParser op("Allowed options");
        auto helpSwitch = op.add<Switch>("h", "help", "Produce help message, use -hh to show options from config file");
        auto versionSwitch = op.add<Switch>("v", "version", "Show version number");
        auto config_file_option = op.add<Value<string>>("c", "config", "Path to the configuration file", config_file, &config_file);

        OptionParser conf("Overridable config file options");

        // discovery settings
        conf.add<Value<string>>("", "discovery.browser", "mDNS browser, called as '<browser> -B <service_type> <domain>'", settings.session.browser,
                                &settings.session.browser);
        conf.add<Value<string>>("", "discovery.service_type", "service type to browse for", settings.session.service_type, &settings.session.service_type);
        conf.add<Value<string>>("", "discovery.domain", "domain to browse in", settings.session.domain, &settings.session.domain);
        conf.add<Value<size_t>>("", "discovery.timeout", "max. duration of the discovery [ms]", timeout_ms, &timeout_ms);
        conf.add<Value<size_t>>("", "discovery.header_lines", "number of banner lines printed by the browser", settings.session.header_lines,
                                &settings.session.header_lines);

        // logging settings
        conf.add<Value<string>>("", "logging.sink", "log sink [null,system,stdout,stderr,file:<filename>]", settings.logging.sink, &settings.logging.sink);
        auto logfilterOption = conf.add<Value<string>>(
            "", "logging.filter",
            "log filter <tag>:<level>[,<tag>:<level>]* with tag = * or <log tag> and level = [trace,debug,info,notice,warning,error,fatal]",
            settings.logging.filter);

        // Parse command line arguments
        try
        {
            op.parse(argc, argv);
        }
        catch (const std::invalid_argument& e)
        {
            cerr << "Exception: " << e.what() << "\n";
            cout << "\n" << op << "\n";
            exit(EXIT_FAILURE);
        }

        if (versionSwitch->is_set())
        {
            cout << "vncdiscover " << version::full() << "\n"
                 << "License GPLv3+: GNU GPL version 3 or later <http://gnu.org/licenses/gpl.html>.\n"
                 << "This is free software: you are free to change and redistribute it.\n"
                 << "There is NO WARRANTY, to the extent permitted by law.\n\n";
            exit(EXIT_SUCCESS);
        }

        if (helpSwitch->is_set())
        {
            cout << op << "\n";
            if (helpSwitch->count() > 1)
                cout << conf << "\n";
            exit(EXIT_SUCCESS);
        }

        // Parse configuration file and overrides from command line
        try
        {
            if (config_file_option->is_set() && !std::filesystem::exists(config_file))
                throw std::invalid_argument("config file not found: " + config_file);
            conf.parse(config_file);
            conf.parse(argc, argv);
        }
        catch (const std::invalid_argument& e)
        {
            cerr << "Exception: " << e.what() << "\n";
            cout << "\n" << op << "\n";
            if (helpSwitch->count() > 1)
                cout << conf << "\n";
            exit(EXIT_FAILURE);
        }

        settings.session.timeout = std::chrono::milliseconds(timeout_ms);
        if (settings.session.service_type.empty())
            throw DiscoverException("discovery.service_type must not be empty");
        if (settings.session.timeout.count() == 0)
            throw DiscoverException("discovery.timeout must be > 0");

        settings.logging.filter = logfilterOption->value();
        if (logfilterOption->is_set())
        {
            for (size_t n = 1; n < logfilterOption->count(); ++n)
                settings.logging.filter += "," + logfilterOption->value(n);
        }

        AixLog::Filter logfilter;
        auto filters = utils::string::split(settings.logging.filter, ',');
        for (const auto& filter : filters)
            logfilter.add_filter(filter);

        string logformat = "%Y-%m-%d %H-%M-%S.#ms [#severity] (#tag_func)";
        if (settings.logging.sink.find("file:") != string::npos)
        {
            string logfile = settings.logging.sink.substr(settings.logging.sink.find(':') + 1);
            AixLog::Log::init<AixLog::SinkFile>(logfilter, logfile, logformat);
        }
        else if (settings.logging.sink == "stdout")
            AixLog::Log::init<AixLog::SinkCout>(logfilter, logformat);
        else if (settings.logging.sink == "stderr")
            AixLog::Log::init<AixLog::SinkCerr>(logfilter, logformat);
        else if (settings.logging.sink == "system")
            AixLog::Log::init<AixLog::SinkNative>("vncdiscover", logfilter);
        else if (settings.logging.sink == "null")
            AixLog::Log::init<AixLog::SinkNull>();
        else
            throw DiscoverException("Invalid log sink: " + settings.logging.sink);

        LOG(INFO, LOG_TAG) << "Version " << version::code << (!version::rev().empty() ? (", revision " + version::rev(8)) : ("")) << "\n";

        boost::asio::io_context io_context;
        discovery::SessionRunner runner(io_context, settings.session);

        // Construct a signal set registered for process termination.
        boost::asio::signal_set signals(io_context, SIGHUP, SIGINT, SIGTERM);
        signals.async_wait(
            [&runner](const boost::system::error_code& ec, int signal)
            {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (!ec)
                LOG(INFO, LOG_TAG) << "Received signal " << signal << ": " << strsignal(signal) << "\n";
            else
                LOG(INFO, LOG_TAG) << "Failed to wait for signal, error: " << ec.message() << "\n";
            runner.cancel();
        });

        discovery::SessionResult result;
        runner.start(
            [&result, &signals](discovery::SessionResult session_result)
            {
            result = std::move(session_result);
            boost::system::error_code ec;
            signals.cancel(ec);
            if (ec)
                LOG(DEBUG, LOG_TAG) << "Failed to cancel signal set: " << ec.message() << "\n";
        });
        io_context.run();

        if (result.reason == discovery::TerminationReason::process_error)
        {
            LOG(ERROR, LOG_TAG) << "Discovery failed: " << result.error.detailed_message() << "\n";
            cerr << "Failed to start '" << settings.session.browser << "': " << result.error.detailed_message() << "\n";
            exitcode = EXIT_SPAWN_FAILURE;
        }
        else
        {
            discovery::ResultReporter(cout).report(result);
        }
    }
    catch (const std::exception& e)
    {
        LOG(FATAL, LOG_TAG) << "Exception: " << e.what() << std::endl;
        exitcode = EXIT_FAILURE;
    }

    LOG(DEBUG, LOG_TAG) << "vncdiscover terminated." << endl;
    exit(exitcode);
}
