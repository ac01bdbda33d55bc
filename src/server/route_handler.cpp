//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <stackroute/server/route_handler.hpp>
#include <boost/beast/http/field.hpp>

namespace stackroute {

route_params::
~route_params()
{
}

void
route_params::
reset()
{
    url = {};
    req = {};
    res = {};
    base_path = {};
    path = {};
}

route_params&
route_params::
status(
    http::status code)
{
    res.result(code);
    return *this;
}

route_params&
route_params::
set_body(std::string s)
{
    if(res.find(http::field::content_type) == res.end())
    {
        res.set(http::field::content_type,
            "text/plain; charset=UTF-8");
    }
    res.body() = std::move(s);
    res.prepare_payload();
    return *this;
}

route_result
route_params::
send(std::string_view body)
{
    set_body(std::string(body));
    return route::send;
}

} // stackroute
