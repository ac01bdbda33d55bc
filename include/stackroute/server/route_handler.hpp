//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STACKROUTE_SERVER_ROUTE_HANDLER_HPP
#define STACKROUTE_SERVER_ROUTE_HANDLER_HPP

#include <stackroute/detail/config.hpp>
#include <stackroute/server/router_types.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/url/url_view.hpp>
#include <string>
#include <string_view>

namespace stackroute {

/** What HTTP handlers receive

    One of these is reused by a connection for each
    request it reads. The router only touches the
    members inherited from @ref route_params_base.
*/
struct STACKROUTE_SYMBOL_VISIBLE
    route_params : route_params_base
{
    /// The request target, as read from the request line
    urls::url_view url;

    /// The request
    http::request<http::string_body> req;

    /// The response handlers fill in
    http::response<http::string_body> res;

    /** Suspends the running handler

        Empty unless the request is being
        handled by an @ref application.
    */
    suspender suspend;

    STACKROUTE_DECL
    ~route_params();

    /// Clear the target, both messages and the paths
    STACKROUTE_DECL
    void reset();

    /// Set the response status, returning `*this`
    STACKROUTE_DECL
    route_params&
    status(http::status code);

    /** Replace the response body

        Content-Length is updated, and Content-Type is
        set to plain text unless a handler already set it.
    */
    STACKROUTE_DECL
    route_params&
    set_body(std::string s);

    /** Replace the response body and finish

        @code
        r.use( "/ping",
            []( route_params& p )
            {
                return p.send( "pong" );
            } );
        @endcode

        @return @ref route::send, for the
        handler to return.
    */
    STACKROUTE_DECL
    route_result
    send(std::string_view body);
};

} // stackroute

#endif
