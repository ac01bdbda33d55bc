//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <stackroute/server/route_handler.hpp>

#include <stackroute/server/router.hpp>

#include <boost/core/lightweight_test.hpp>
#include <string>

namespace stackroute {

struct route_handler_test
{
    void
    testSend()
    {
        route_params p;
        auto rv = p.send("hello");
        BOOST_TEST(rv == route::send);
        BOOST_TEST_EQ(p.res.body(), "hello");
        BOOST_TEST_EQ(p.res[http::field::content_type],
            "text/plain; charset=UTF-8");
        BOOST_TEST_EQ(p.res[http::field::content_length], "5");
    }

    void
    testContentType()
    {
        route_params p;
        p.res.set(http::field::content_type, "application/json");
        p.set_body("{}");
        BOOST_TEST_EQ(p.res[http::field::content_type],
            "application/json");
    }

    void
    testStatus()
    {
        route_params p;
        p.status(http::status::not_found);
        BOOST_TEST(p.res.result() == http::status::not_found);
    }

    void
    testReset()
    {
        route_params p;
        p.req.target("/x");
        p.status(http::status::accepted);
        p.send("body");
        p.reset();
        BOOST_TEST(p.req.target().empty());
        BOOST_TEST(p.res.result() == http::status::ok);
        BOOST_TEST(p.res.body().empty());
        BOOST_TEST(p.path.empty());
    }

    void
    testRouter()
    {
        // handlers observe the params passed to dispatch
        router r;
        r.use("/api",
            [](route_params& p)
            {
                BOOST_TEST_EQ(p.base_path, "/api");
                BOOST_TEST_EQ(p.path, "/v1");
                return p.send("api");
            });
        route_params p;
        auto rv = r.dispatch(
            urls::url_view("/api/v1"), p);
        BOOST_TEST(rv == route::send);
        BOOST_TEST_EQ(p.res.body(), "api");
    }

    void
    run()
    {
        testSend();
        testContentType();
        testStatus();
        testReset();
        testRouter();
    }
};

} // stackroute

int
main()
{
    stackroute::route_handler_test().run();
    return boost::report_errors();
}
