/*

test_range.cpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE range_test

#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailsync/imap/range.hpp>

using mailsync::imap::uid_range;
using mailsync::imap::uid_t;


BOOST_AUTO_TEST_CASE(range_compress_merges_adjacent_and_overlapping)
{
    auto r = uid_range::from_list({9, 1, 2, 3, 5, 3, 10, 11, 7});
    BOOST_TEST(r.to_imap_set() == "1:3,5,7,9:11");
    BOOST_TEST(r.size() == 8u);
    BOOST_TEST(r.intervals().size() == 4u);
    BOOST_TEST(*r.min() == 1u);
    BOOST_TEST(*r.max() == 11u);
}

BOOST_AUTO_TEST_CASE(range_compress_uncompress_roundtrip)
{
    const std::vector<uid_t> uids{1, 2, 4, 8, 9, 10, 100};
    auto r = uid_range::from_list(uids);
    BOOST_TEST(r.to_list() == uids, boost::test_tools::per_element());
    BOOST_TEST(uid_range::from_list(r.to_list()) == r);
}

BOOST_AUTO_TEST_CASE(range_equal_iff_same_set)
{
    uid_range a;
    a.insert(3);
    a.insert(1, 2);
    a.insert(4);
    BOOST_TEST(a == uid_range(1, 4));
    BOOST_TEST(a != uid_range(1, 5));
}

BOOST_AUTO_TEST_CASE(range_empty_forms)
{
    uid_range empty;
    BOOST_TEST(empty.empty());
    BOOST_TEST(empty.to_imap_set().empty());
    BOOST_TEST(!empty.min().has_value());
    BOOST_TEST(uid_range(5, 4).empty());
    BOOST_TEST(uid_range::from_list({}) == empty);
}

BOOST_AUTO_TEST_CASE(range_set_algebra)
{
    const uid_range a = uid_range::from_list({1, 2, 3, 4, 5, 10});
    const uid_range b = uid_range::from_list({4, 5, 6, 10});

    BOOST_TEST(a.unite(b).to_imap_set() == "1:6,10");
    BOOST_TEST(a.subtract(b).to_imap_set() == "1:3");
    BOOST_TEST(a.intersect(b).to_imap_set() == "4:5,10");
    BOOST_TEST(a.clamp(3, 9).to_imap_set() == "3:5");
    BOOST_TEST(a.complement(1, 12).to_imap_set() == "6:9,11:12");
}

BOOST_AUTO_TEST_CASE(range_erase_splits_interval)
{
    uid_range r(1, 10);
    r.erase(4, 6);
    BOOST_TEST(r.to_imap_set() == "1:3,7:10");
    r.erase(1, 1);
    BOOST_TEST(r.to_imap_set() == "2:3,7:10");
    BOOST_TEST(!r.contains(5));
    BOOST_TEST(r.contains(8));
}

BOOST_AUTO_TEST_CASE(range_parse_sequence_set)
{
    auto r = uid_range::parse_imap_set("7,1:3,5:4");
    BOOST_REQUIRE(r);
    BOOST_TEST(r->to_imap_set() == "1:5,7");

    BOOST_TEST(!uid_range::parse_imap_set("1:*"));
    BOOST_TEST(!uid_range::parse_imap_set("0"));
    BOOST_TEST(!uid_range::parse_imap_set("1,,2"));
}
