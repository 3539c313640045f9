/*

test_log.cpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE log_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailsync/detail/log.hpp>

namespace logging = mailsync::log;


BOOST_AUTO_TEST_CASE(parse_level_names)
{
    BOOST_CHECK(logging::parse_level("debug") == logging::level::debug);
    BOOST_CHECK(logging::parse_level("WARNING") == logging::level::warn);
    BOOST_CHECK(logging::parse_level("Off") == logging::level::off);
    BOOST_CHECK(!logging::parse_level("verbose").has_value());
}

BOOST_AUTO_TEST_CASE(callback_receives_filtered_entries)
{
    auto& logger = logging::logger::instance();
    std::vector<logging::entry> seen;
    logger.set_callback([&seen](const logging::entry& e) { seen.push_back(e); });
    logger.set_level(logging::level::warn);

    MAILSYNC_INFO("IMAP work: hidden");
    MAILSYNC_WARN("IMAP work: shown");
    logger.set_trace_enabled(true);
    logger.trace_protocol("IMAP", "work", logging::direction::send, "1 NOOP\r\n");
    logger.set_trace_enabled(false);
    logger.trace_protocol("IMAP", "work", logging::direction::send, "2 NOOP\r\n");

    logger.clear_callback();
    logger.set_level(logging::level::info);

    BOOST_REQUIRE(seen.size() == 2u);
    BOOST_TEST(seen[0].message == "IMAP work: shown");
    BOOST_CHECK(!seen[0].trace_info.has_value());
    BOOST_REQUIRE(seen[1].trace_info.has_value());
    BOOST_TEST(seen[1].trace_info->server == "work");
    BOOST_TEST(seen[1].trace_info->data == "1 NOOP\r\n");
}
