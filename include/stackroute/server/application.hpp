//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STACKROUTE_SERVER_APPLICATION_HPP
#define STACKROUTE_SERVER_APPLICATION_HPP

#include <stackroute/detail/config.hpp>
#include <stackroute/server/router.hpp>
#include <functional>

namespace stackroute {

/** The entry point for requests.

    An application is a @ref router which knows how to take
    a request message from the transport, route it, and report
    the outcome when routing finishes, either synchronously
    or after a suspended handler resumes.

    Applications are routers, so one application may be
    mounted into another with @ref basic_router::use.

    @par Example
    @code
    application app;
    app.use( "/hello",
        []( route_params& p )
        {
            return p.send( "Hello, world!" );
        } );

    route_params p;
    p.req.method( http::verb::get );
    p.req.target( "/hello" );
    app.handle( p );    // p.res now holds the response
    @endcode
*/
class STACKROUTE_DECL
    application : public router
{
public:
    /** The function invoked when routing finishes
    */
    using done_handler = std::function<
        void(route_params&, route_result)>;

    /** Constructor
    */
    explicit
    application(
        router_options options = {});

    /** Handle a request using the final handler.

        Equivalent to `handle( p, &application::final_handler )`.
    */
    void
    handle(route_params& p) const;

    /** Handle a request.

        The request target of `p.req` is parsed and routed through
        the application. When routing finishes, `done` is invoked
        exactly once with the result. This happens before `handle`
        returns, unless a handler suspends, in which case it
        happens when the last suspended handler is resumed.

        A resumer invoked from inside the function passed to
        @ref suspender is deferred until the suspending dispatch
        has unwound.

        @param p The params holding the request. It must
        remain valid until `done` is invoked.

        @param done The function to invoke with the result.
    */
    void
    handle(
        route_params& p,
        done_handler done) const;

    /** Write the default response for a routing result.

        @li @ref route::next: 404 Not Found.
        @li @ref error::bad_target: 400 Bad Request.
        @li Any other failure: 500 Internal Server Error,
        with the message of the error as the body.
        @li Otherwise the response is left unchanged.
    */
    static
    void
    final_handler(
        route_params& p,
        route_result rv);

private:
    class handle_op;
};

} // stackroute

#endif
