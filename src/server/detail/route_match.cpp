//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/server/detail/pct_decode.hpp"
#include "src/server/detail/route_match.hpp"
#include <stackroute/detail/except.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <boost/url/pct_string_view.hpp>
#include <boost/assert.hpp>

namespace stackroute {
namespace detail {

route_match::
route_match(
    std::string_view pat)
    : decoded_pat_(
        [&pat]
        {
            if(pat.empty())
                return std::string("/");
            if(pat.front() != '/')
                detail::throw_invalid_argument();
            auto rv = urls::make_pct_string_view(pat);
            if(! rv)
                detail::throw_invalid_argument();
            auto s = pct_decode(*rv);
            if( s.size() > 1
                && s.back() == '/')
                s.pop_back();
            return s;
        }())
    , slash_(decoded_pat_ == "/")
{
}

boost::optional<std::string_view>
route_match::
match(
    std::string_view path,
    bool case_sensitive) const noexcept
{
    if(slash_)
        return path.substr(0, 0);
    auto const n = decoded_pat_.size();
    if(path.size() < n)
        return boost::none;
    auto const s = path.substr(0, n);
    if(case_sensitive)
    {
        if(s != decoded_pat_)
            return boost::none;
    }
    else if(! grammar::ci_is_equal(
        boost::core::string_view(s),
        boost::core::string_view(decoded_pat_)))
    {
        return boost::none;
    }
    // the prefix must end on a segment boundary
    if( path.size() > n &&
        path[n] != '/')
        return boost::none;
    return s;
}

bool
route_match::
operator()(
    route_params_base& p,
    bool case_sensitive,
    route_params_base::match_result& mr) const
{
    BOOST_ASSERT(! p.path.empty());
    auto const m = match(p.path, case_sensitive);
    if(! m)
        return false;
    // number of matching characters
    mr.consume(p, m->size());
    return true;
}

} // detail
} // stackroute
