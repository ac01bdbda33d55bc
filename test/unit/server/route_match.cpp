//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/server/detail/route_match.hpp"
#include "src/server/detail/pct_decode.hpp"

#include <boost/core/lightweight_test.hpp>
#include <stdexcept>

namespace stackroute {
namespace detail {

struct route_match_test
{
    // checks that `pat` matches `path`, consuming `want`
    void
    yes(
        std::string_view pat,
        std::string_view path,
        std::string_view want,
        bool case_sensitive = false)
    {
        route_match m(pat);
        auto const rv = m.match(path, case_sensitive);
        if(BOOST_TEST(rv.has_value()))
        {
            BOOST_TEST_EQ(*rv, want);
            // the result refers to the request path
            BOOST_TEST(rv->data() == path.data());
        }
    }

    void
    no(
        std::string_view pat,
        std::string_view path,
        bool case_sensitive = false)
    {
        route_match m(pat);
        BOOST_TEST(! m.match(path, case_sensitive).has_value());
    }

    void
    testPattern()
    {
        BOOST_TEST_EQ(route_match("").pattern(), "/");
        BOOST_TEST_EQ(route_match("/").pattern(), "/");
        BOOST_TEST_EQ(route_match("/api").pattern(), "/api");
        BOOST_TEST_EQ(route_match("/api/").pattern(), "/api");
        BOOST_TEST_EQ(route_match("/a%62c").pattern(), "/abc");
        BOOST_TEST_EQ(route_match("/x%2Fz").pattern(), "/x/z");
        BOOST_TEST_THROWS(route_match("api"),
            std::invalid_argument);
        BOOST_TEST_THROWS(route_match("*"),
            std::invalid_argument);

        // malformed escapes
        BOOST_TEST_THROWS(route_match("/a%zz"),
            std::invalid_argument);
        BOOST_TEST_THROWS(route_match("/a%4"),
            std::invalid_argument);
    }

    void
    testMatch()
    {
        // root matches everything and consumes nothing
        yes("/", "/", "");
        yes("/", "/foo", "");
        yes("",  "/foo/bar", "");

        // segment boundaries
        yes("/foo", "/foo", "/foo");
        yes("/foo", "/foo/", "/foo");
        yes("/foo", "/foo/bar", "/foo");
        yes("/foo/bar", "/foo/bar/baz", "/foo/bar");
        no("/foo", "/foobar");
        no("/foo", "/fo");
        no("/foo", "/");
        no("/foo/bar", "/foo");

        // case
        yes("/foo", "/FOO/bar", "/FOO");
        no("/foo", "/FOO/bar", true);
        yes("/Foo", "/Foo", "/Foo", true);
    }

    void
    testPctDecode()
    {
        BOOST_TEST_EQ(pct_decode(
            urls::pct_string_view("/a%20b")), "/a b");
        BOOST_TEST_EQ(pct_decode(
            urls::pct_string_view("/a%2fb")), "/a/b");

        // separators stay escaped in request paths
        BOOST_TEST_EQ(pct_decode(
            urls::pct_string_view("/a%2fb%5Cc%41"), true),
            "/a%2fb%5CcA");
        BOOST_TEST_EQ(pct_decode(
            urls::pct_string_view("/plain"), true), "/plain");
    }

    void
    run()
    {
        testPattern();
        testMatch();
        testPctDecode();
    }
};

} // detail
} // stackroute

int
main()
{
    stackroute::detail::route_match_test().run();
    return boost::report_errors();
}
