//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <stackroute/server/router_types.hpp>

#include <stackroute/error.hpp>

#include <boost/core/lightweight_test.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

namespace stackroute {

struct router_types_test
{
    template<typename Error>
    void
    check(
        char const* name,
        Error ev)
    {
        auto const ec = make_error_code(ev);
        BOOST_TEST(std::string(ec.category().name()) == name);
        BOOST_TEST(! ec.message().empty());
        BOOST_TEST(
            std::addressof(ec.category()) ==
            std::addressof(make_error_code(ev).category()));
        BOOST_TEST(ec.category().equivalent(
            static_cast<typename std::underlying_type<Error>::type>(ev),
                ec.category().default_error_condition(
                    static_cast<typename std::underlying_type<Error>::type>(ev))));
        BOOST_TEST(ec.category().equivalent(ec,
            static_cast<typename std::underlying_type<Error>::type>(ev)));
    }

    // records what the resumer delivers
    struct owner : suspender::owner
    {
        int suspends = 0;
        route_result rv;
        std::exception_ptr ep;

        resumer
        do_suspend() override
        {
            ++suspends;
            return resumer(*this);
        }

        void
        do_resume(route_result const& rv_) override
        {
            rv = rv_;
        }

        void
        do_resume(std::exception_ptr ep_) override
        {
            ep = ep_;
        }
    };

    void
    testCategories()
    {
        {
            char const* const n = "stackroute.route";
            check(n, route::close);
            check(n, route::complete);
            check(n, route::suspend);
            check(n, route::next);
            check(n, route::send);
        }
        {
            char const* const n = "stackroute";
            check(n, error::unhandled_exception);
            check(n, error::bad_target);
        }

        BOOST_TEST(is_route_result(route::next));
        BOOST_TEST(! is_route_result(error::bad_target));
        BOOST_TEST(! is_route_result(system::error_code()));

        // route values are not failures
        route_result rv = route::send;
        BOOST_TEST(! rv.failed());
        rv = error::unhandled_exception;
        BOOST_TEST(rv.failed());

        // converts to std::error_code through Boost.System
        std::error_code sec = make_error_code(error::bad_target);
        BOOST_TEST(sec.message() == "bad request target");
    }

    void
    testSuspender()
    {
        // empty
        {
            suspender s;
            BOOST_TEST_THROWS(s([](resumer){}),
                std::logic_error);
            resumer r;
            BOOST_TEST_THROWS(r(route::next),
                std::invalid_argument);
            BOOST_TEST_THROWS(r(std::exception_ptr()),
                std::invalid_argument);
        }

        {
            owner o;
            suspender s(o);
            resumer saved;
            auto rv = s(
                [&saved](resumer r)
                {
                    saved = r;
                });
            BOOST_TEST(rv == route::suspend);
            BOOST_TEST_EQ(o.suspends, 1);
            saved(route::send);
            BOOST_TEST(o.rv == route::send);
            saved(std::make_exception_ptr(
                std::runtime_error("ex")));
            BOOST_TEST(o.ep != nullptr);
        }
    }

    void
    run()
    {
        testCategories();
        testSuspender();
    }
};

} // stackroute

int
main()
{
    stackroute::router_types_test().run();
    return boost::report_errors();
}
