//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STACKROUTE_SRC_SERVER_DETAIL_ROUTER_BASE_HPP
#define STACKROUTE_SRC_SERVER_DETAIL_ROUTER_BASE_HPP

#include <stackroute/server/detail/router_base.hpp>
#include "src/server/detail/route_match.hpp"
#include <vector>

namespace stackroute {
namespace detail {

// one use() or except() call
struct router_base::layer
{
    route_match pattern;
    std::vector<handler_ptr> entries;

    layer(
        std::string_view pat,
        std::vector<handler_ptr> hv)
        : pattern(pat)
        , entries(std::move(hv))
    {
    }

    // handlers added to a mounted router afterwards
    // change its size, so this is not cached
    std::size_t
    count() const noexcept
    {
        std::size_t n = 0;
        for(auto const& h : entries)
            n += h->count();
        return n;
    }
};

struct router_base::impl
{
    std::vector<layer> layers;
    opt_flags opt;

    // levels above this router, set when mounted
    std::size_t depth = 0;

    explicit
    impl(opt_flags opt_) noexcept
        : opt(opt_)
    {
    }
};

} // detail
} // stackroute

#endif
