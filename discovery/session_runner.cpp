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
#include "session_runner.hpp"

// local headers
#include "common/discover_exception.hpp"
#include "discovery_error.hpp"
#include "record_parser.hpp"

// 3rd party headers
#include <aixlog.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>

// standard headers
#include <string>
#include <utility>


using namespace std;

namespace discovery
{

static constexpr auto LOG_TAG = "SessionRunner";


std::string to_string(SessionState state)
{
    switch (state)
    {
        case SessionState::starting:
            return "starting";
        case SessionState::streaming:
            return "streaming";
        case SessionState::draining:
            return "draining";
        case SessionState::done:
            return "done";
    }
    return "unknown";
}


SessionRunner::SessionRunner(boost::asio::io_context& ioc, SessionConfig config, SessionListener* listener)
    : ioc_(ioc), config_(std::move(config)), listener_(listener), process_(ioc), watchdog_(ioc.get_executor())
{
}


void SessionRunner::setState(SessionState state)
{
    LOG(TRACE, LOG_TAG) << "State: " << to_string(state_) << " => " << to_string(state) << "\n";
    state_ = state;
    if (listener_ != nullptr)
        listener_->onStateChanged(state_);
}


void SessionRunner::start(ResultHandler&& handler)
{
    if (started_)
        throw DiscoverException("Session already started");
    started_ = true;
    handler_ = std::move(handler);
    setState(SessionState::starting);
    if (cancel_requested_)
    {
        LOG(INFO, LOG_TAG) << "Cancelled before start\n";
        drain(TerminationReason::cancelled);
        return;
    }

    LOG(INFO, LOG_TAG) << "Browsing for '" << config_.service_type << "' in '" << config_.domain << "', timeout: " << config_.timeout.count() << "ms\n";
    try
    {
        process_.launch(config_.browser, config_.browserArgs());
    }
    catch (const DiscoverException& e)
    {
        LOG(ERROR, LOG_TAG) << e.what() << "\n";
        drain(TerminationReason::process_error, vncdiscover::ErrorCode(e.code(), e.detail()));
        return;
    }

    watchdog_.start(config_.timeout,
                    [this](std::chrono::milliseconds ms)
                    {
        LOG(INFO, LOG_TAG) << "No end of batch within " << ms.count() << "ms\n";
        drain(TerminationReason::timeout, vncdiscover::ErrorCode(make_error_code(DiscoveryErrc::timeout), std::to_string(ms.count()) + "ms"));
    });
    setState(SessionState::streaming);
    readLine();
}


void SessionRunner::cancel()
{
    boost::asio::post(ioc_,
                      [this]()
                      {
        // picked up by start()
        if (!started_)
        {
            cancel_requested_ = true;
            return;
        }
        drain(TerminationReason::cancelled);
    });
}


void SessionRunner::readLine()
{
    boost::asio::async_read_until(process_.output(), streambuf_, '\n',
                                  [this](const boost::system::error_code& ec, std::size_t bytes_transferred)
                                  {
        // pipe closed by drain()
        if (state_ != SessionState::streaming)
            return;

        if (ec)
        {
            if (ec != boost::asio::error::eof)
                LOG(WARNING, LOG_TAG) << "Error while reading from '" << config_.browser << "': " << ec.message() << "\n";

            // last line without newline
            if (streambuf_.size() > 0)
            {
                std::string line{buffers_begin(streambuf_.data()), buffers_end(streambuf_.data())};
                streambuf_.consume(streambuf_.size());
                if (onLine(std::move(line)))
                {
                    drain(TerminationReason::heuristic_satisfied);
                    return;
                }
            }
            drain(TerminationReason::stream_closed);
            return;
        }

        // Extract up to the first delimiter.
        std::string line{buffers_begin(streambuf_.data()), buffers_begin(streambuf_.data()) + bytes_transferred - 1};
        streambuf_.consume(bytes_transferred);
        if (onLine(std::move(line)))
            drain(TerminationReason::heuristic_satisfied);
        else
            readLine();
    });
}


bool SessionRunner::onLine(std::string line)
{
    std::size_t index = line_index_++;
    ParseResult result = parseLine(line, index, config_);
    switch (result.status)
    {
        case ParseStatus::skip:
            LOG(DEBUG, LOG_TAG) << "Header line " << index << ": " << line << "\n";
            return false;
        case ParseStatus::malformed:
            LOG(DEBUG, LOG_TAG) << "Ignoring line " << index << ", " << result.error.detailed_message() << "\n";
            return false;
        case ParseStatus::record:
            break;
    }

    records_.push_back(std::move(*result.record));
    const DiscoveryRecord& record = records_.back();
    LOG(DEBUG, LOG_TAG) << "Record " << records_.size() << ": " << record << "\n";
    if (listener_ != nullptr)
        listener_->onRecord(record);

    return heuristic_.observe(record);
}


void SessionRunner::drain(TerminationReason reason, vncdiscover::ErrorCode error)
{
    if ((state_ == SessionState::draining) || (state_ == SessionState::done) || !started_)
        return;

    LOG(DEBUG, LOG_TAG) << "Draining, reason: " << to_string(reason) << ", records: " << records_.size() << "\n";
    setState(SessionState::draining);
    watchdog_.stop();
    bool terminated = process_.terminate();
    if (listener_ != nullptr)
        listener_->onCleanup(terminated);

    SessionResult result;
    result.records = std::move(records_);
    result.reason = reason;
    result.error = std::move(error);
    records_.clear();

    setState(SessionState::done);
    auto handler = std::move(handler_);
    handler_ = nullptr;
    if (handler)
        handler(std::move(result));
}


SessionResult SessionRunner::run(const SessionConfig& config, SessionListener* listener)
{
    boost::asio::io_context ioc;
    SessionRunner runner(ioc, config, listener);
    SessionResult result;
    runner.start([&result](SessionResult session_result) { result = std::move(session_result); });
    ioc.run();
    return result;
}

} // namespace discovery
