//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STACKROUTE_SERVER_DETAIL_ROUTE_MATCH_HPP
#define STACKROUTE_SERVER_DETAIL_ROUTE_MATCH_HPP

#include <stackroute/detail/config.hpp>
#include <stackroute/server/router_types.hpp>
#include <boost/optional.hpp>
#include <string>
#include <string_view>

namespace stackroute {
namespace detail {

/** Matches a request path against a mount point

    The mount point is a path prefix which only matches
    at a segment boundary: "/foo" matches "/foo" and
    "/foo/bar" but never "/foobar". The root "/" matches
    every path and consumes nothing.
*/
class route_match
{
public:
    /** Constructor

        The pattern is percent-decoded and a trailing
        slash is removed. An empty pattern is the root.

        @throw std::invalid_argument The pattern does
        not start with a slash, or holds a malformed
        percent escape.
    */
    explicit
    route_match(std::string_view pat);

    /// Return the normalized mount path
    std::string_view
    pattern() const noexcept
    {
        return decoded_pat_;
    }

    /** Return the matched prefix of `path`, if any
    */
    boost::optional<std::string_view>
    match(
        std::string_view path,
        bool case_sensitive) const noexcept;

    // true if match, moves the matched
    // prefix from p.path to p.base_path
    bool operator()(
        route_params_base& p,
        bool case_sensitive,
        route_params_base::match_result& mr) const;

private:
    std::string decoded_pat_;
    bool slash_;
};

} // detail
} // stackroute

#endif
