//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <stackroute/error.hpp>

namespace stackroute {
namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "stackroute";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::success: return "success";
    case error::unhandled_exception: return "unhandled exception";
    case error::bad_target: return "bad request target";
    default:
        return "unknown";
    }
}

constinit error_cat_type error_cat;

} // detail
} // stackroute
