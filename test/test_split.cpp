/*

test_split.cpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE split_test

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailsync/imap/split.hpp>

#include "fake_imap_server.hpp"

using mailsync::imap::classification;
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


static bool starts_with(const std::string& text, std::string_view prefix)
{
    return text.rfind(prefix, 0) == 0;
}

/// Inbox with three new messages (1 work, 2 both, 3 spam), one seen and one deleted.
static std::string inbox_server(const std::string& line, bool create_fails)
{
    const std::string command = command_of(line);
    if (starts_with(command, "SELECT"))
        return "* 5 EXISTS\r\n* OK [UIDNEXT 6] next\r\n" + tagged(line, "OK [READ-WRITE] selected");
    if (starts_with(command, "UID FETCH 1:* "))
        return "* 1 FETCH (UID 1 FLAGS ())\r\n"
               "* 2 FETCH (UID 2 FLAGS (\\Recent))\r\n"
               "* 3 FETCH (UID 3 FLAGS ())\r\n"
               "* 4 FETCH (UID 4 FLAGS (\\Seen))\r\n"
               "* 5 FETCH (UID 5 FLAGS (\\Deleted))\r\n"
            + tagged(line, "OK fetched");
    if (starts_with(command, "UID FETCH 1:3 "))
        return "* 1 FETCH (UID 1 BODY[HEADER] {15}\r\nSubject: work\r\n BODY[1] {3}\r\nabc)\r\n"
               "* 2 FETCH (UID 2 BODY[HEADER] {15}\r\nSubject: both\r\n BODY[1] {3}\r\ndef)\r\n"
               "* 3 FETCH (UID 3 BODY[HEADER] {15}\r\nSubject: spam\r\n BODY[1] {3}\r\nghi)\r\n"
            + tagged(line, "OK fetched");
    if (starts_with(command, "LIST"))
        return "* LIST (\\HasNoChildren) \"/\" INBOX\r\n* LIST (\\HasNoChildren) \"/\" \"Work\"\r\n"
            + tagged(line, "OK listed");
    if (starts_with(command, "CREATE") && create_fails)
        return tagged(line, "NO [CANNOT] no such hierarchy");
    return tagged(line, "OK done");
}

static classification route(std::string_view raw)
{
    classification where;
    if (raw.find("Subject: work") != std::string_view::npos)
        where.destinations = {"Work"};
    else if (raw.find("Subject: both") != std::string_view::npos)
        where.destinations = {"Work", "Archive"};
    else if (raw.find("Subject: spam") != std::string_view::npos)
        where.discard = true;
    return where;
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

BOOST_AUTO_TEST_CASE(split_copies_creates_and_deletes)
{
    fake_imap_server server("* OK [CAPABILITY IMAP4rev1 UIDPLUS] ready\r\n",
        [](const std::string& line, std::size_t) { return inbox_server(line, false); });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        session s(co_await asio::this_coro::executor, local_config(port));
        BOOST_REQUIRE(co_await s.connect(nullptr));
        BOOST_REQUIRE(co_await s.read_greeting());

        std::vector<std::string> seen;
        auto report = co_await imap::split_incoming(s,
            [&seen](std::string_view raw)
            {
                seen.emplace_back(raw);
                return route(raw);
            });
        BOOST_REQUIRE(report);

        BOOST_TEST(report->incoming == uid_range(1, 3));
        BOOST_REQUIRE(seen.size() == 3u);
        BOOST_TEST(seen[0] == "Subject: work\r\nabc");
        BOOST_TEST(seen[2] == "Subject: spam\r\nghi");

        BOOST_REQUIRE(report->copied.size() == 2u);
        BOOST_TEST(report->copied.at("Work") == uid_range(1, 2));
        BOOST_TEST(report->copied.at("Archive") == uid_range(2, 2));
        BOOST_TEST(report->failed.empty());
        BOOST_TEST(report->discarded == uid_range(3, 3));
        BOOST_TEST(report->deleted == uid_range(1, 3));
        BOOST_TEST(report->expunge == expunge_outcome::expunged_scoped);
        BOOST_CHECK(!report->partial_failure.has_value());
    });
    server.stop();

    const auto commands = server.commands();
    BOOST_TEST(sent(commands, "UID FETCH 1:3 (UID BODY.PEEK[HEADER] BODY.PEEK[1])"));
    BOOST_TEST(sent(commands, "CREATE \"Archive\""));
    BOOST_TEST(!sent(commands, "CREATE \"Work\""));
    BOOST_TEST(sent(commands, "UID COPY 1:2 \"Work\""));
    BOOST_TEST(sent(commands, "UID COPY 2 \"Archive\""));
    BOOST_TEST(sent(commands, "UID STORE 1:3 +FLAGS.SILENT (\\Deleted)"));
    BOOST_TEST(sent(commands, "UID EXPUNGE 1:3"));
}

BOOST_AUTO_TEST_CASE(split_failed_destination_is_partial_failure)
{
    fake_imap_server server("* OK [CAPABILITY IMAP4rev1] ready\r\n",
        [](const std::string& line, std::size_t) { return inbox_server(line, true); });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        session s(co_await asio::this_coro::executor, local_config(port));
        BOOST_REQUIRE(co_await s.connect(nullptr));
        BOOST_REQUIRE(co_await s.read_greeting());

        auto report = co_await imap::split_incoming(s, route);
        BOOST_REQUIRE(report);

        BOOST_REQUIRE(report->copied.size() == 1u);
        BOOST_TEST(report->copied.at("Work") == uid_range(1, 2));
        BOOST_REQUIRE(report->failed.size() == 1u);
        BOOST_TEST(report->failed.at("Archive") == uid_range(2, 2));
        BOOST_TEST(report->deleted == uid_range(1, 3));

        // Without UIDPLUS and without permission for a plain EXPUNGE the messages stay marked.
        BOOST_TEST(report->expunge == expunge_outcome::not_expunged);

        BOOST_REQUIRE(report->partial_failure.has_value());
        BOOST_TEST(report->partial_failure->code == mailsync::errc::split_partial_failure);
        BOOST_CHECK(mailsync::classify(report->partial_failure->code) == mailsync::error_class::partial_failure);
        BOOST_TEST(report->partial_failure->detail.find("failed=Archive 2") != std::string::npos);
    });
    server.stop();

    const auto commands = server.commands();
    BOOST_TEST(!sent(commands, "UID COPY 2 \"Archive\""));
    BOOST_TEST(!sent(commands, "EXPUNGE"));
}

BOOST_AUTO_TEST_CASE(split_empty_inbox_does_nothing)
{
    fake_imap_server server("* OK ready\r\n",
        [](const std::string& line, std::size_t)
        {
            if (starts_with(command_of(line), "SELECT"))
                return "* 0 EXISTS\r\n" + tagged(line, "OK selected");
            return tagged(line, "OK done");
        });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        session s(co_await asio::this_coro::executor, local_config(port));
        BOOST_REQUIRE(co_await s.connect(nullptr));
        BOOST_REQUIRE(co_await s.read_greeting());

        auto report = co_await imap::split_incoming(s, route);
        BOOST_REQUIRE(report);
        BOOST_TEST(report->incoming.empty());
        BOOST_TEST(report->copied.empty());
        BOOST_TEST(report->expunge == expunge_outcome::nothing_to_do);
    });
    server.stop();
    BOOST_TEST(server.commands().size() == 1u);
}

BOOST_AUTO_TEST_CASE(split_missing_inbox_fails)
{
    fake_imap_server server("* OK ready\r\n",
        [](const std::string& line, std::size_t) { return tagged(line, "NO [NONEXISTENT] no such mailbox"); });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        auto config = local_config(port);
        config.inbox = "Incoming";
        session s(co_await asio::this_coro::executor, config);
        BOOST_REQUIRE(co_await s.connect(nullptr));
        BOOST_REQUIRE(co_await s.read_greeting());

        auto report = co_await imap::split_incoming(s, route);
        BOOST_REQUIRE(!report);
        BOOST_CHECK(!s.selected_mailbox().has_value());
    });
}

BOOST_AUTO_TEST_CASE(split_follows_server_config)
{
    fake_imap_server server("* OK [CAPABILITY IMAP4rev1] ready\r\n",
        [](const std::string& line, std::size_t) { return inbox_server(line, false); });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        auto config = local_config(port);
        config.inbox = "Incoming";
        config.allow_unscoped_expunge = true;
        session s(co_await asio::this_coro::executor, config);
        BOOST_REQUIRE(co_await s.connect(nullptr));
        BOOST_REQUIRE(co_await s.read_greeting());

        auto report = co_await imap::split_incoming(s, route);
        BOOST_REQUIRE(report);
        BOOST_TEST(report->deleted == uid_range(1, 3));
        BOOST_TEST(report->expunge == expunge_outcome::expunged_all);
        BOOST_CHECK(s.selected_mailbox() == std::optional<std::string>("Incoming"));
    });
    server.stop();

    const auto commands = server.commands();
    BOOST_TEST(sent(commands, "SELECT \"Incoming\""));
    BOOST_TEST(!sent(commands, "SELECT \"INBOX\""));
    BOOST_TEST(sent(commands, "EXPUNGE"));
}
