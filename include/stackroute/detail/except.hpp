//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STACKROUTE_DETAIL_EXCEPT_HPP
#define STACKROUTE_DETAIL_EXCEPT_HPP

#include <stackroute/detail/config.hpp>
#include <boost/assert/source_location.hpp>

namespace stackroute {
namespace detail {

STACKROUTE_DECL
BOOST_NORETURN
void
throw_invalid_argument(
    boost::source_location const& loc =
        BOOST_CURRENT_LOCATION);

STACKROUTE_DECL
BOOST_NORETURN
void
throw_logic_error(
    boost::source_location const& loc =
        BOOST_CURRENT_LOCATION);

STACKROUTE_DECL
BOOST_NORETURN
void
throw_length_error(
    char const* what,
    boost::source_location const& loc =
        BOOST_CURRENT_LOCATION);

} // detail
} // stackroute

#endif
