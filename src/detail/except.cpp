//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <stackroute/detail/except.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>

namespace stackroute {
namespace detail {

void
throw_invalid_argument(
    boost::source_location const& loc)
{
    boost::throw_exception(
        std::invalid_argument(
            "invalid argument"), loc);
}

void
throw_logic_error(
    boost::source_location const& loc)
{
    boost::throw_exception(
        std::logic_error(
            "logic error"), loc);
}

void
throw_length_error(
    char const* what,
    boost::source_location const& loc)
{
    boost::throw_exception(
        std::length_error(what), loc);
}

} // detail
} // stackroute
