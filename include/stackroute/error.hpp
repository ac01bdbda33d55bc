//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STACKROUTE_ERROR_HPP
#define STACKROUTE_ERROR_HPP

#include <stackroute/detail/config.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <type_traits>

namespace stackroute {

/** Error codes returned by the library.
*/
enum class error
{
    /// Success
    success = 0,

    /** A route handler threw an exception.

        The exception is captured by the router at the call
        site and routing continues in error mode. Error handlers
        receive this code, and exception handlers receive the
        captured exception itself.
    */
    unhandled_exception,

    /// The request target could not be parsed as an origin-form
    bad_target
};

} // stackroute

namespace boost {
namespace system {
template<>
struct is_error_code_enum<
    ::stackroute::error>
{
    static bool const value = true;
};
} // system
} // boost

namespace stackroute {

namespace detail {

struct STACKROUTE_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    STACKROUTE_DECL const char* name(
        ) const noexcept override;
    STACKROUTE_DECL std::string message(
        int) const override;
    STACKROUTE_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x8b3e5c1d2a7f6094)
    {
    }
};

STACKROUTE_DECL extern
    error_cat_type error_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

} // stackroute

#endif
