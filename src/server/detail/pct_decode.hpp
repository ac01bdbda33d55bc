//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STACKROUTE_SERVER_DETAIL_PCT_DECODE_HPP
#define STACKROUTE_SERVER_DETAIL_PCT_DECODE_HPP

#include <stackroute/detail/config.hpp>
#include <boost/url/pct_string_view.hpp>
#include <string>

namespace stackroute {
namespace detail {

/** Return `s` with its percent escapes decoded

    Mount patterns are decoded completely. Request
    paths are decoded with `keep_separators` set, so
    that "%2F" and "%5C" are copied through unchanged
    and never end a path segment.
*/
std::string
pct_decode(
    urls::pct_string_view s,
    bool keep_separators = false);

} // detail
} // stackroute

#endif
