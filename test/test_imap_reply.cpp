/*

test_imap_reply.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE imap_reply_test

#include <string>
#include <string_view>
#include <boost/test/unit_test.hpp>
#include <mailsync/imap/reply.hpp>

using namespace std::string_view_literals;
namespace imap = mailsync::imap;


BOOST_AUTO_TEST_CASE(reply_parse_nested_lists_and_codes)
{
    auto tree = imap::parse_reply("* OK [PERMANENTFLAGS (\\Seen \\*)] Limited (see \"docs\")");
    BOOST_REQUIRE(tree);
    BOOST_REQUIRE(tree->items.size() == 5u);
    BOOST_TEST(tree->items[0].text() == "*");
    BOOST_TEST(tree->items[1].text() == "OK");

    const imap::reply_attrs* code = imap::response_code(*tree);
    BOOST_REQUIRE(code != nullptr);
    BOOST_REQUIRE(code->items.size() == 3u);
    BOOST_TEST(code->items[0] == "PERMANENTFLAGS");
    auto flags = imap::unparen_items(code->items, 1);
    BOOST_REQUIRE(flags.size() == 2u);
    BOOST_TEST(flags[0] == "\\Seen");
    BOOST_TEST(flags[1] == "\\*");

    const imap::reply_list* inner = tree->items[4].list();
    BOOST_REQUIRE(inner != nullptr);
    BOOST_REQUIRE(inner->items.size() == 2u);
    BOOST_TEST(inner->items[1].text() == "docs");
    BOOST_TEST(inner->items[1].atom()->quoted);
}

BOOST_AUTO_TEST_CASE(reply_atom_keeps_section_brackets)
{
    auto tree = imap::parse_reply("* 3 FETCH (UID 9 BODY[HEADER.FIELDS (FROM TO)] NIL FLAGS ())");
    BOOST_REQUIRE(tree);
    const imap::reply_list* data = imap::fetch_data(*tree);
    BOOST_REQUIRE(data != nullptr);
    BOOST_TEST(*imap::number_of(imap::find_item(*data, "UID")) == 9u);
    const imap::reply_node* body = imap::find_item(*data, "BODY[HEADER.FIELDS (FROM TO)]");
    BOOST_REQUIRE(body != nullptr);
    BOOST_TEST(body->is_nil());
    const imap::reply_node* flags = imap::find_item(*data, "flags");
    BOOST_REQUIRE(flags != nullptr);
    BOOST_REQUIRE(flags->list() != nullptr);
    BOOST_TEST(flags->list()->items.empty());
}

BOOST_AUTO_TEST_CASE(reply_unbalanced_is_parse_error)
{
    auto open = imap::parse_reply("* 1 FETCH (UID 4");
    BOOST_REQUIRE(!open);
    BOOST_TEST(open.error().code == mailsync::errc::imap_parse_error);

    BOOST_TEST(!imap::parse_reply("* OK \"unterminated"));
    BOOST_TEST(!imap::parse_reply("* 1 FETCH (UID 4))"));
}

BOOST_AUTO_TEST_CASE(reply_literal_unfolds_to_exact_bytes)
{
    const std::string raw = "* 1 FETCH (UID 5 BODY[1] {11}\r\nhello world)\r\n";
    auto unfolded = imap::unfold_literals(raw);
    BOOST_REQUIRE(unfolded);
    auto lines = imap::split_logical_lines(*unfolded);
    BOOST_REQUIRE(lines.size() == 1u);

    auto tree = imap::parse_reply(lines[0]);
    BOOST_REQUIRE(tree);
    const imap::reply_list* data = imap::fetch_data(*tree);
    BOOST_REQUIRE(data != nullptr);
    const imap::reply_node* body = imap::find_item(*data, "BODY[1]");
    BOOST_REQUIRE(body != nullptr);
    BOOST_TEST(body->text() == "hello world");
}

BOOST_AUTO_TEST_CASE(reply_literal_with_special_bytes)
{
    // 11 bytes: quote, parenthesis, CRLF, backslash, a fake tagged line and a NUL.
    const std::string payload("\")\r\n\\1 OK\0z", 11);
    const std::string raw = "* 2 FETCH (BODY[] {11}\r\n" + payload + " UID 7)\r\n";

    BOOST_TEST(imap::logical_line_end(raw, 0) == raw.size());
    auto unfolded = imap::unfold_literals(raw);
    BOOST_REQUIRE(unfolded);
    auto lines = imap::split_logical_lines(*unfolded);
    BOOST_REQUIRE(lines.size() == 1u);
    auto tree = imap::parse_reply(lines[0]);
    BOOST_REQUIRE(tree);
    const imap::reply_list* data = imap::fetch_data(*tree);
    BOOST_REQUIRE(data != nullptr);
    BOOST_TEST(imap::find_item(*data, "BODY[]")->text() == payload);
    BOOST_TEST(*imap::number_of(imap::find_item(*data, "UID")) == 7u);
}

BOOST_AUTO_TEST_CASE(reply_truncated_literal)
{
    auto unfolded = imap::unfold_literals("* 1 FETCH (BODY[] {20}\r\nshort)\r\n");
    BOOST_REQUIRE(!unfolded);
    BOOST_TEST(unfolded.error().code == mailsync::errc::imap_parse_error);
    BOOST_TEST(imap::logical_line_end("* 1 FETCH (BODY[] {20}\r\nshort)\r\n", 0) == std::string_view::npos);
}

BOOST_AUTO_TEST_CASE(reply_literal_plus_and_bare_lf)
{
    auto unfolded = imap::unfold_literals("* 1 FETCH (BODY[1] {3+}\nabc)\n");
    BOOST_REQUIRE(unfolded);
    BOOST_TEST(*unfolded == "* 1 FETCH (BODY[1] \"abc\")\n");
}

BOOST_AUTO_TEST_CASE(reply_tagged_line_detection)
{
    auto ok = imap::parse_tagged_line("12 OK [READ-WRITE] SELECT completed\r\n");
    BOOST_REQUIRE(ok);
    BOOST_TEST(ok->tag == 12u);
    BOOST_TEST(ok->st == imap::status::ok);
    BOOST_TEST(ok->text == "[READ-WRITE] SELECT completed");

    BOOST_TEST(imap::parse_tagged_line("3 bad syntax")->st == imap::status::bad);
    BOOST_TEST(!imap::parse_tagged_line("* OK still here"));
    BOOST_TEST(!imap::parse_tagged_line("+ continue"));
    BOOST_TEST(!imap::parse_tagged_line("A1 OK done"));
    BOOST_TEST(!imap::parse_tagged_line("4 PREAUTH hello"));
}

BOOST_AUTO_TEST_CASE(reply_isolate_last_unit)
{
    const std::string buffer =
        "* 4 EXISTS\r\n"
        "1 OK NOOP done\r\n"
        "* 1 FETCH (UID 3 BODY[] {6}\r\n* 9 X\n)\r\n"
        "* 2 FETCH (UID 4)\r\n"
        "2 OK FETCH done\r\n";
    const std::size_t start = imap::isolate_last_response_unit(buffer);
    BOOST_TEST(std::string_view(buffer).substr(start).starts_with("* 1 FETCH"));

    const std::size_t first = imap::isolate_last_response_unit(std::string_view(buffer).substr(0, start));
    BOOST_TEST(first == 0u);
}

BOOST_AUTO_TEST_CASE(reply_logical_lines_skip_literal_content)
{
    const std::string buffer = "* 1 FETCH (BODY[] {4}\r\na\r\nb)\r\n3 OK done\r\n";
    auto starts = imap::logical_line_starts(buffer);
    BOOST_REQUIRE(starts.size() == 2u);
    BOOST_TEST(std::string_view(buffer).substr(starts[1]) == "3 OK done\r\n");
}

BOOST_AUTO_TEST_CASE(reply_status_words)
{
    BOOST_TEST(imap::parse_status_word("ok") == imap::status::ok);
    BOOST_TEST(imap::parse_status_word("PREAUTH") == imap::status::preauth);
    BOOST_TEST(imap::parse_status_word("Bye") == imap::status::bye);
    BOOST_TEST(imap::parse_status_word("FETCH") == imap::status::unknown);
}
