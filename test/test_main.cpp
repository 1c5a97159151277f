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

// local headers
#include "common/discover_exception.hpp"
#include "common/error_code.hpp"
#include "common/utils/string_utils.hpp"
#include "discovery/discovery_error.hpp"
#include "discovery/discovery_record.hpp"
#include "discovery/record_parser.hpp"
#include "discovery/result_reporter.hpp"
#include "discovery/session_config.hpp"
#include "discovery/session_result.hpp"
#include "discovery/termination_heuristic.hpp"

// 3rd party headers
#include <catch2/catch_test_macros.hpp>

// standard headers
#include <string>
#include <system_error>
#include <vector>


using namespace std;
using namespace discovery;


namespace
{
DiscoveryRecord makeRecord(const std::string& name, uint32_t flags, ChangeType change_type = ChangeType::added)
{
    DiscoveryRecord record;
    record.timestamp = "12:00:00.100";
    record.change_type = change_type;
    record.flags = flags;
    record.interface_index = 4;
    record.domain = "local.";
    record.service_type = "_rfb._tcp.";
    record.instance_name = name;
    return record;
}
} // namespace


TEST_CASE("String utils")
{
    using namespace utils::string;

    string s = "  test \t";
    REQUIRE(trim(s) == "test");
    REQUIRE(trim_copy("\t a b  ") == "a b");
    REQUIRE(tolower_copy("AdD") == "add");

    auto strings = split("", '*');
    REQUIRE(strings.empty());

    strings = split("1**2", '*');
    REQUIRE(strings.size() == 3);
    REQUIRE(strings[0] == "1");
    REQUIRE(strings[1].empty());
    REQUIRE(strings[2] == "2");

    strings = split_whitespace("");
    REQUIRE(strings.empty());

    strings = split_whitespace("   \t ");
    REQUIRE(strings.empty());

    strings = split_whitespace("  a   b\tc  ");
    REQUIRE(strings.size() == 3);
    REQUIRE(strings[0] == "a");
    REQUIRE(strings[1] == "b");
    REQUIRE(strings[2] == "c");

    strings = split_whitespace("a b  My   Mac  ", 3);
    REQUIRE(strings.size() == 3);
    REQUIRE(strings[0] == "a");
    REQUIRE(strings[1] == "b");
    REQUIRE(strings[2] == "My   Mac");

    strings = split_whitespace("a b", 3);
    REQUIRE(strings.size() == 2);
}


TEST_CASE("Error")
{
    std::error_code ec = DiscoveryErrc::browser_not_found;
    REQUIRE(ec);
    REQUIRE(ec == DiscoveryErrc::browser_not_found);
    REQUIRE(ec != DiscoveryErrc::spawn_failed);
    REQUIRE(string(ec.category().name()) == "discovery");
    REQUIRE(ec.message() == "Browser executable not found");

    std::error_code success = DiscoveryErrc::success;
    REQUIRE(!success);

    vncdiscover::ErrorCode error(make_error_code(DiscoveryErrc::spawn_failed), "\"/bin/dns-sd\"");
    REQUIRE(error == DiscoveryErrc::spawn_failed);
    REQUIRE(error.detail() == "\"/bin/dns-sd\"");
    REQUIRE(error.detailed_message() == "Failed to start browser process: \"/bin/dns-sd\"");

    vncdiscover::ErrorCode no_detail(make_error_code(DiscoveryErrc::timeout));
    REQUIRE(no_detail.detail().empty());
    REQUIRE(no_detail.detailed_message() == "Timeout exceeded");

    DiscoverException e(make_error_code(DiscoveryErrc::browser_not_found), "\"dns-sd\"");
    REQUIRE(e.code() == DiscoveryErrc::browser_not_found);
    REQUIRE(e.detail() == "\"dns-sd\"");
    REQUIRE(string(e.what()) == "Browser executable not found: \"dns-sd\"");

    DiscoverException plain("Invalid log sink: foo");
    REQUIRE(!plain.code());
    REQUIRE(string(plain.what()) == "Invalid log sink: foo");
}


TEST_CASE("ErrorOr")
{
    {
        vncdiscover::ErrorOr<std::string> error_or("test");
        REQUIRE(error_or.hasValue());
        REQUIRE(!error_or.hasError());
        REQUIRE(error_or.getValue() == "test");
        REQUIRE(error_or.takeValue() == "test");
    }

    {
        vncdiscover::ErrorOr<uint32_t> error_or(vncdiscover::ErrorCode(make_error_code(DiscoveryErrc::invalid_number), "'x'"));
        REQUIRE(error_or.hasError());
        REQUIRE(!error_or.hasValue());
        REQUIRE(error_or.getError() == DiscoveryErrc::invalid_number);
        REQUIRE(error_or.getError().detail() == "'x'");
    }
}


TEST_CASE("Change type")
{
    REQUIRE(to_string(ChangeType::added) == "Add");
    REQUIRE(to_string(ChangeType::removed) == "Rmv");
    REQUIRE(change_type_from_string("Add") == ChangeType::added);
    REQUIRE(change_type_from_string("RMV") == ChangeType::removed);
    REQUIRE(!change_type_from_string("Mod").has_value());
    REQUIRE(!change_type_from_string("").has_value());
}


TEST_CASE("Parse number")
{
    auto number = parseNumber("3");
    REQUIRE(number.hasValue());
    REQUIRE(number.getValue() == 3);

    number = parseNumber("4294967295");
    REQUIRE(number.hasValue());
    REQUIRE(number.getValue() == 4294967295u);

    REQUIRE(parseNumber("4294967296").hasError());
    REQUIRE(parseNumber("").hasError());
    REQUIRE(parseNumber("-1").hasError());
    REQUIRE(parseNumber("0x3").hasError());
    REQUIRE(parseNumber("3a").getError() == DiscoveryErrc::invalid_number);
}


TEST_CASE("Parse line")
{
    SessionConfig config;

    // header lines are not inspected
    for (size_t n = 0; n < config.header_lines; ++n)
    {
        auto result = parseLine("12:00:00.100  Add  2  4 local.  _rfb._tcp.  Header", n, config);
        REQUIRE(result.status == ParseStatus::skip);
        REQUIRE(!result.record.has_value());
    }

    auto result = parseLine("12:00:00.100  Add        3   4 local.               _rfb._tcp.           Brainbug", 4, config);
    REQUIRE(result.status == ParseStatus::record);
    REQUIRE(result.record.has_value());
    REQUIRE(!result.error);
    REQUIRE(result.record->timestamp == "12:00:00.100");
    REQUIRE(result.record->change_type == ChangeType::added);
    REQUIRE(result.record->flags == 3);
    REQUIRE(result.record->interface_index == 4);
    REQUIRE(result.record->domain == "local.");
    REQUIRE(result.record->service_type == "_rfb._tcp.");
    REQUIRE(result.record->instance_name == "Brainbug");
    REQUIRE(result.record->moreComing());

    // instance names with spaces, CR line ending
    result = parseLine("12:00:01.000  Rmv        2  12 local.               _rfb._tcp.           John's  MacBook Pro\r", 5, config);
    REQUIRE(result.status == ParseStatus::record);
    REQUIRE(result.record->change_type == ChangeType::removed);
    REQUIRE(result.record->flags == 2);
    REQUIRE(result.record->interface_index == 12);
    REQUIRE(result.record->instance_name == "John's  MacBook Pro");
    REQUIRE(!result.record->moreComing());

    result = parseLine("", 4, config);
    REQUIRE(result.status == ParseStatus::malformed);
    REQUIRE(result.error == DiscoveryErrc::malformed_record);

    result = parseLine("12:00:00.100  Add  3  4 local.  _rfb._tcp.", 4, config);
    REQUIRE(result.status == ParseStatus::malformed);
    REQUIRE(result.error == DiscoveryErrc::malformed_record);

    result = parseLine("12:00:00.100  Mod  3  4 local.  _rfb._tcp.  Brainbug", 4, config);
    REQUIRE(result.status == ParseStatus::malformed);
    REQUIRE(result.error == DiscoveryErrc::unknown_change_type);

    result = parseLine("12:00:00.100  Add  x  4 local.  _rfb._tcp.  Brainbug", 4, config);
    REQUIRE(result.status == ParseStatus::malformed);
    REQUIRE(result.error == DiscoveryErrc::invalid_number);

    result = parseLine("12:00:00.100  Add  3  if local.  _rfb._tcp.  Brainbug", 4, config);
    REQUIRE(result.status == ParseStatus::malformed);
    REQUIRE(result.error == DiscoveryErrc::invalid_number);

    // no header
    config.header_lines = 0;
    result = parseLine("12:00:00.100 Add 2 4 local. _rfb._tcp. Tesla", 0, config);
    REQUIRE(result.status == ParseStatus::record);
    REQUIRE(result.record->instance_name == "Tesla");
}


TEST_CASE("Record")
{
    auto record = makeRecord("Brainbug", 3);
    REQUIRE(record.toString() == "12:00:00.100 Add 3 4 local. _rfb._tcp. Brainbug");
    REQUIRE(makeRecord("My Mac", 0, ChangeType::removed).toString() == "12:00:00.100 Rmv 0 4 local. _rfb._tcp. My Mac");
    REQUIRE(record == makeRecord("Brainbug", 3));
    REQUIRE(!(record == makeRecord("Brainbug", 2)));

    REQUIRE(makeRecord("a", 1).moreComing());
    REQUIRE(makeRecord("a", 3).moreComing());
    REQUIRE(!makeRecord("a", 0).moreComing());
    REQUIRE(!makeRecord("a", 2).moreComing());
}


TEST_CASE("Termination heuristic")
{
    TerminationHeuristic heuristic;
    REQUIRE(!heuristic.satisfied());
    REQUIRE(heuristic.observed() == 0);

    REQUIRE(!heuristic.observe(makeRecord("Brainbug", 3)));
    REQUIRE(!heuristic.observe(makeRecord("Dell", 3)));
    REQUIRE(!heuristic.satisfied());
    REQUIRE(heuristic.observe(makeRecord("Tesla", 2)));
    REQUIRE(heuristic.satisfied());
    REQUIRE(heuristic.observed() == 3);

    // stays satisfied
    REQUIRE(heuristic.observe(makeRecord("Late", 3)));
    REQUIRE(heuristic.observed() == 4);

    TerminationHeuristic single;
    REQUIRE(single.observe(makeRecord("Tesla", 0)));
}


TEST_CASE("Result reporter")
{
    SessionResult result;
    result.reason = TerminationReason::stream_closed;
    REQUIRE(ResultReporter::format(result) == "No hosts found.\n");

    result.reason = TerminationReason::heuristic_satisfied;
    result.records.push_back(makeRecord("Brainbug", 3));
    result.records.push_back(makeRecord("Tesla", 2));
    REQUIRE(ResultReporter::format(result) ==
            "12:00:00.100 Add 3 4 local. _rfb._tcp. Brainbug\n"
            "12:00:00.100 Add 2 4 local. _rfb._tcp. Tesla\n"
            "2 host(s) found.\n");

    result.reason = TerminationReason::timeout;
    result.records.resize(1);
    REQUIRE(ResultReporter::format(result) == "12:00:00.100 Add 3 4 local. _rfb._tcp. Brainbug\n1 host(s) found.\n");
}


TEST_CASE("Termination reason")
{
    REQUIRE(to_string(TerminationReason::heuristic_satisfied) == "heuristic-satisfied");
    REQUIRE(to_string(TerminationReason::stream_closed) == "stream-closed");
    REQUIRE(to_string(TerminationReason::timeout) == "timeout");
    REQUIRE(to_string(TerminationReason::cancelled) == "cancelled");
    REQUIRE(to_string(TerminationReason::process_error) == "process-error");
}


TEST_CASE("Session config")
{
    SessionConfig config;
    REQUIRE(config.browser == "dns-sd");
    REQUIRE(config.timeout.count() == 500);
    REQUIRE(config.header_lines == 4);
    vector<string> expected{"-B", "_rfb._tcp", "local."};
    REQUIRE(config.browserArgs() == expected);
}
