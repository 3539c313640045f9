/*

test_expunge.cpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE expunge_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailsync/imap/expunge.hpp>
#include <mailsync/imap/mailbox.hpp>

#include "fake_imap_server.hpp"

using mailsync::imap::expunge_outcome;
using mailsync::imap::session;
using mailsync::imap::uid_range;
using mailsync_test::command_of;
using mailsync_test::fake_imap_server;
using mailsync_test::local_config;
using mailsync_test::run_client;
using mailsync_test::tagged;
namespace asio = mailsync::asio;
namespace imap = mailsync::imap;


static std::string mailbox_server(const std::string& line, std::size_t)
{
    const std::string command = command_of(line);
    if (command.rfind("SELECT", 0) == 0)
        return "* 4 EXISTS\r\n* OK [UIDVALIDITY 7] ok\r\n" + tagged(line, "OK [READ-WRITE] selected");
    return tagged(line, "OK done");
}

static bool sent(const std::vector<std::string>& commands, const std::string& command)
{
    for (const auto& line : commands)
    {
        if (command_of(line) == command)
            return true;
    }
    return false;
}

BOOST_AUTO_TEST_CASE(delete_without_uidplus_leaves_messages)
{
    fake_imap_server server("* OK [CAPABILITY IMAP4rev1] ready\r\n", mailbox_server);

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        session s(co_await asio::this_coro::executor, local_config(port));
        BOOST_REQUIRE(co_await s.connect(nullptr));
        BOOST_REQUIRE(co_await s.read_greeting());
        BOOST_REQUIRE(co_await imap::select_mailbox(s, "INBOX"));

        auto outcome = co_await imap::delete_articles(s, uid_range(3, 4), false);
        BOOST_REQUIRE(outcome);
        BOOST_TEST(*outcome == expunge_outcome::not_expunged);
    });
    server.stop();

    const auto commands = server.commands();
    BOOST_TEST(sent(commands, "UID STORE 3:4 +FLAGS.SILENT (\\Deleted)"));
    BOOST_TEST(!sent(commands, "EXPUNGE"));
    BOOST_TEST(commands.size() == 2u);
}

BOOST_AUTO_TEST_CASE(delete_with_uidplus_is_scoped)
{
    fake_imap_server server("* OK [CAPABILITY IMAP4rev1 UIDPLUS] ready\r\n", mailbox_server);

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        session s(co_await asio::this_coro::executor, local_config(port));
        BOOST_REQUIRE(co_await s.connect(nullptr));
        BOOST_REQUIRE(co_await s.read_greeting());
        BOOST_REQUIRE(co_await imap::select_mailbox(s, "INBOX"));

        auto uids = uid_range::from_list({2, 5, 6});
        auto outcome = co_await imap::delete_articles(s, uids, false);
        BOOST_REQUIRE(outcome);
        BOOST_TEST(*outcome == expunge_outcome::expunged_scoped);
    });
    server.stop();

    const auto commands = server.commands();
    BOOST_TEST(sent(commands, "UID STORE 2,5:6 +FLAGS.SILENT (\\Deleted)"));
    BOOST_TEST(sent(commands, "UID EXPUNGE 2,5:6"));
    BOOST_TEST(!sent(commands, "EXPUNGE"));
}

BOOST_AUTO_TEST_CASE(delete_unscoped_when_allowed)
{
    fake_imap_server server("* OK [CAPABILITY IMAP4rev1] ready\r\n", mailbox_server);

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        session s(co_await asio::this_coro::executor, local_config(port));
        BOOST_REQUIRE(co_await s.connect(nullptr));
        BOOST_REQUIRE(co_await s.read_greeting());
        BOOST_REQUIRE(co_await imap::select_mailbox(s, "INBOX"));

        auto outcome = co_await imap::delete_articles(s, uid_range(1, 1), true);
        BOOST_REQUIRE(outcome);
        BOOST_TEST(*outcome == expunge_outcome::expunged_all);
    });
    server.stop();
    BOOST_TEST(sent(server.commands(), "EXPUNGE"));
}

BOOST_AUTO_TEST_CASE(delete_nothing_or_unselected)
{
    fake_imap_server server("* OK [CAPABILITY IMAP4rev1 UIDPLUS] ready\r\n", mailbox_server);

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        session s(co_await asio::this_coro::executor, local_config(port));
        BOOST_REQUIRE(co_await s.connect(nullptr));
        BOOST_REQUIRE(co_await s.read_greeting());

        auto empty = co_await imap::delete_articles(s, uid_range{}, true);
        BOOST_REQUIRE(empty);
        BOOST_TEST(*empty == expunge_outcome::nothing_to_do);

        auto unselected = co_await imap::delete_articles(s, uid_range(1, 2), true);
        BOOST_REQUIRE(!unselected);
        BOOST_TEST(unselected.error().code == mailsync::errc::imap_invalid_state);
    });
    server.stop();
    BOOST_TEST(server.commands().empty());
}

BOOST_AUTO_TEST_CASE(delete_store_refused)
{
    fake_imap_server server("* OK [CAPABILITY IMAP4rev1 UIDPLUS] ready\r\n",
        [](const std::string& line, std::size_t index)
        {
            if (command_of(line).rfind("UID STORE", 0) == 0)
                return tagged(line, "NO [READ-ONLY] mailbox is read-only");
            return mailbox_server(line, index);
        });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        session s(co_await asio::this_coro::executor, local_config(port));
        BOOST_REQUIRE(co_await s.connect(nullptr));
        BOOST_REQUIRE(co_await s.read_greeting());
        BOOST_REQUIRE(co_await imap::select_mailbox(s, "INBOX"));

        auto outcome = co_await imap::delete_articles(s, uid_range(1, 3), true);
        BOOST_REQUIRE(!outcome);
        BOOST_TEST(outcome.error().code == mailsync::errc::imap_tagged_no);
        BOOST_TEST(s.is_open());
    });
    server.stop();
    BOOST_TEST(!sent(server.commands(), "UID EXPUNGE 1:3"));
}
