/*

test_body_structure.cpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE body_structure_test

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <boost/test/unit_test.hpp>
#include <mailsync/imap/article.hpp>

using mailsync::imap::body_part;
using mailsync::imap::part_policy;
namespace imap = mailsync::imap;


static body_part structure_of(std::string_view text)
{
    auto tree = imap::parse_reply(text);
    BOOST_REQUIRE(tree);
    BOOST_REQUIRE(!tree->items.empty());
    BOOST_REQUIRE(tree->items[0].list() != nullptr);
    auto part = imap::parse_body_structure(*tree->items[0].list());
    BOOST_REQUIRE(part);
    imap::number_parts(*part);
    return *part;
}

static const std::string_view two_leaves =
    "((\"TEXT\" \"PLAIN\" (\"CHARSET\" \"utf-8\") NIL NIL \"7BIT\" 12 1 NIL NIL NIL)"
    "(\"IMAGE\" \"PNG\" (\"NAME\" \"a.png\") NIL NIL \"BASE64\" 1000 NIL NIL NIL)"
    " \"MIXED\" (\"BOUNDARY\" \"XYZ\") NIL NIL)";

static const std::string_view nested =
    "(((\"TEXT\" \"PLAIN\" NIL NIL NIL \"7BIT\" 3 1)(\"TEXT\" \"HTML\" NIL NIL NIL \"QUOTED-PRINTABLE\" 9 1)"
    " \"ALTERNATIVE\" (\"BOUNDARY\" \"alt\"))(\"APPLICATION\" \"PDF\" NIL NIL NIL \"BASE64\" 100)"
    " \"MIXED\" (\"BOUNDARY\" \"mix\"))";


BOOST_AUTO_TEST_CASE(body_structure_two_leaves)
{
    const body_part root = structure_of(two_leaves);
    BOOST_TEST(root.multipart());
    BOOST_TEST(root.subtype == "MIXED");
    BOOST_TEST(*root.param("boundary") == "XYZ");
    BOOST_REQUIRE(root.children.size() == 2u);
    BOOST_TEST(root.children[0].part_id == "1");
    BOOST_TEST(root.children[0].content_type() == "text/plain");
    BOOST_TEST(root.children[0].encoding == "7BIT");
    BOOST_TEST(root.children[0].size == 12u);
    BOOST_TEST(root.children[1].part_id == "2");
    BOOST_TEST(root.children[1].content_type() == "image/png");
}

BOOST_AUTO_TEST_CASE(body_structure_nested_numbering)
{
    const body_part root = structure_of(nested);
    BOOST_REQUIRE(root.children.size() == 2u);
    BOOST_REQUIRE(root.children[0].children.size() == 2u);
    BOOST_TEST(root.children[0].part_id == "1");
    BOOST_TEST(root.children[0].children[0].part_id == "1.1");
    BOOST_TEST(root.children[0].children[1].part_id == "1.2");
    BOOST_TEST(root.children[1].part_id == "2");
}

BOOST_AUTO_TEST_CASE(body_structure_single_leaf_is_part_one)
{
    const body_part root = structure_of("(\"TEXT\" \"PLAIN\" (\"CHARSET\" \"us-ascii\") NIL NIL \"7BIT\" 5 1)");
    BOOST_TEST(!root.multipart());
    BOOST_TEST(root.part_id == "1");

    auto wanted = imap::select_wanted_parts(root, part_policy::first_part_only());
    BOOST_REQUIRE(wanted);
    BOOST_TEST(wanted->size() == 1u);
    BOOST_TEST(wanted->contains("1"));
}

BOOST_AUTO_TEST_CASE(body_structure_malformed)
{
    auto tree = imap::parse_reply("(\"TEXT\" \"PLAIN\" NIL)");
    BOOST_REQUIRE(tree);
    auto part = imap::parse_body_structure(*tree);
    BOOST_REQUIRE(!part);
    BOOST_TEST(part.error().code == mailsync::errc::imap_bodystructure_invalid);

    BOOST_TEST(!imap::parse_body_structure(imap::reply_list{}));

    auto no_subtype = imap::parse_reply("((\"TEXT\" \"PLAIN\" NIL NIL NIL \"7BIT\" 3))");
    BOOST_REQUIRE(no_subtype);
    BOOST_TEST(!imap::parse_body_structure(*no_subtype->items[0].list()));
}

BOOST_AUTO_TEST_CASE(wanted_parts_by_content_type)
{
    const body_part root = structure_of(nested);

    auto text = imap::select_wanted_parts(root, part_policy::content_type_matching("text/.*"));
    BOOST_REQUIRE(text);
    BOOST_TEST(*text == (std::set<std::string>{"1.1", "1.2"}), boost::test_tools::per_element());

    auto html = imap::select_wanted_parts(root, part_policy::content_type_matching("TEXT/HTML"));
    BOOST_REQUIRE(html);
    BOOST_TEST(*html == (std::set<std::string>{"1.2"}), boost::test_tools::per_element());

    // Whole-string match: "text" alone matches nothing.
    auto partial = imap::select_wanted_parts(root, part_policy::content_type_matching("text"));
    BOOST_REQUIRE(partial);
    BOOST_TEST(partial->empty());

    auto bad = imap::select_wanted_parts(root, part_policy::content_type_matching("text/("));
    BOOST_REQUIRE(!bad);
    BOOST_TEST(bad.error().code == mailsync::errc::invalid_argument);
}

BOOST_AUTO_TEST_CASE(wanted_parts_first_part)
{
    const body_part root = structure_of(two_leaves);
    auto wanted = imap::select_wanted_parts(root, part_policy::first_part_only());
    BOOST_REQUIRE(wanted);
    BOOST_TEST(*wanted == (std::set<std::string>{"1"}), boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(reconstruct_two_leaves_with_boundary)
{
    const body_part root = structure_of(two_leaves);
    const std::string header =
        "From: a@example.com\r\n"
        "Subject: hi\r\n"
        "Content-Type: multipart/mixed;\r\n"
        "\tboundary=\"XYZ\"\r\n"
        "MIME-Version: 1.0\r\n"
        "\r\n";
    const std::map<std::string, std::string> parts{{"1", "hello there\r\n"}};

    auto message = imap::reconstruct_partial(header, root, parts);
    BOOST_REQUIRE(message);

    const std::string expected =
        "From: a@example.com\n"
        "Subject: hi\n"
        "MIME-Version: 1.0\n"
        "Content-type: multipart/mixed; boundary=\"XYZ\"\n\n"
        "\n--XYZ\n"
        "Content-type: text/plain; charset=\"utf-8\"\n"
        "Content-transfer-encoding: 7BIT\n\n"
        "hello there\r\n"
        "\n--XYZ\n"
        "Content-type: image/png\n"
        "Content-transfer-encoding: BASE64\n\n"
        "\n--XYZ--\n";
    BOOST_TEST(*message == expected);
}

BOOST_AUTO_TEST_CASE(reconstruct_nested_keeps_inner_boundaries)
{
    const body_part root = structure_of(nested);
    auto message = imap::reconstruct_partial("Subject: x\r\n\r\n", root, {{"1.2", "<p>hi</p>"}});
    BOOST_REQUIRE(message);
    BOOST_TEST(message->find("boundary=\"mix\"") != std::string::npos);
    BOOST_TEST(message->find("Content-type: multipart/alternative; boundary=\"alt\"") != std::string::npos);
    BOOST_TEST(message->find("Content-type: text/html\nContent-transfer-encoding: QUOTED-PRINTABLE\n\n<p>hi</p>")
        != std::string::npos);
    BOOST_TEST(message->find("\n--alt--\n") < message->find("\n--mix--\n"));
}

BOOST_AUTO_TEST_CASE(reconstruct_requires_boundary)
{
    const body_part root = structure_of(
        "((\"TEXT\" \"PLAIN\" NIL NIL NIL \"7BIT\" 3 1)(\"TEXT\" \"PLAIN\" NIL NIL NIL \"7BIT\" 3 1) \"MIXED\")");
    auto message = imap::reconstruct_partial("Subject: x\r\n\r\n", root, {});
    BOOST_REQUIRE(!message);
    BOOST_TEST(message.error().code == mailsync::errc::imap_bodystructure_invalid);
}
