/*

test_error_detail.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_detail_test

#include <boost/test/unit_test.hpp>

#include <string>

#include <mailsync/detail/error_detail.hpp>
#include <mailsync/imap/error_mapping.hpp>


BOOST_AUTO_TEST_CASE(error_detail_add_line)
{
    mailsync::detail::error_detail detail;
    detail.add_line("line", "1 LOGIN bob hunter2", false);
    detail.add_line("line", "2 LOGIN bob hunter2", true);
    BOOST_TEST(detail.str() == "line=1 LOGIN bob hunter2\nline=2 LOGIN bob <redacted>\n");
}

BOOST_AUTO_TEST_CASE(error_detail_imap_keys)
{
    const std::string detail = mailsync::imap::make_imap_detail("work", 7, "SELECT", "no such mailbox", 2).str();
    BOOST_TEST(detail == "proto=imap\nserver=work\ntag=7\ncommand=SELECT\ntagged.text=no such mailbox\nuntagged.count=2\n");
}

BOOST_AUTO_TEST_CASE(error_info_carries_detail)
{
    auto failed = mailsync::fail<int>(mailsync::errc::imap_tagged_no, "Command failed.",
        mailsync::imap::make_imap_detail("work", 1, "NOOP", "busy", 0));
    BOOST_REQUIRE(!failed);
    BOOST_TEST(failed.error().message == "Command failed.");
    BOOST_TEST(failed.error().detail.find("command=NOOP\n") != std::string::npos);
}
