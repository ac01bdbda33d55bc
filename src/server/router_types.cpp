//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <stackroute/server/router_types.hpp>
#include <boost/assert.hpp>

namespace stackroute {

namespace detail {

const char*
route_cat_type::
name() const noexcept
{
    return "stackroute.route";
}

std::string
route_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
route_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<route>(ev))
    {
    case route::close: return "finished, close the connection";
    case route::complete: return "finished, response written";
    case route::suspend: return "suspended";
    case route::next: return "not handled";
    case route::send: return "finished, send the response";
    default:
        return "unknown";
    }
}

constinit route_cat_type route_cat;

} // detail

resumer
suspender::
owner::
do_suspend()
{
    detail::throw_logic_error();
}

//------------------------------------------------

void
route_params_base::
match_result::
consume(
    route_params_base& p,
    std::size_t n)
{
    n_ = n;
    if(n == 0)
        return;
    p.base_path = {
        p.base_path.data(),
        p.base_path.size() + n };
    if(n < p.path.size())
    {
        p.path.remove_prefix(n);
        return;
    }
    // nothing is left, the path becomes the
    // slash which dispatch appended
    BOOST_ASSERT(p.addedSlash_);
    p.path = { &p.decoded_path_.back(), 1 };
}

void
route_params_base::
match_result::
restore(route_params_base& p)
{
    if(n_ == 0)
        return;
    bool const appended =
        p.addedSlash_ &&
        p.path.data() == &p.decoded_path_.back();
    auto const rest = appended ? 0 : p.path.size();
    p.base_path.remove_suffix(n_);
    p.path = {
        p.path.data() - n_,
        rest + n_ };
}

} // stackroute
