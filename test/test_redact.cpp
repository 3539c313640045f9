/*

test_redact.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE redact_test

#include <boost/test/unit_test.hpp>
#include <mailsync/detail/redact.hpp>


BOOST_AUTO_TEST_CASE(redact_login)
{
    BOOST_TEST(mailsync::detail::redact_line("3 LOGIN user pass") == "3 LOGIN user <redacted>");
    BOOST_TEST(mailsync::detail::redact_line("3 login \"us er\" \"p w\"\r\n") == "3 login \"us er\" <redacted>\r\n");
}

BOOST_AUTO_TEST_CASE(redact_authenticate)
{
    BOOST_TEST(mailsync::detail::redact_line("4 AUTHENTICATE PLAIN AGFsaWNlAHNlY3JldA==")
        == "4 AUTHENTICATE PLAIN <redacted>");
    BOOST_TEST(mailsync::detail::redact_line("AGFsaWNlAHNlY3JldA==\r\n") == "<redacted>\r\n");
}

BOOST_AUTO_TEST_CASE(redact_leaves_other_commands)
{
    BOOST_TEST(mailsync::detail::redact_line("5 SELECT INBOX") == "5 SELECT INBOX");
    BOOST_TEST(mailsync::detail::redact_line("6 LOGIN") == "6 LOGIN");
    BOOST_TEST(mailsync::detail::redact_line("NOOP") == "NOOP");
}
