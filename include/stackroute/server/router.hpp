//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STACKROUTE_SERVER_ROUTER_HPP
#define STACKROUTE_SERVER_ROUTER_HPP

#include <stackroute/detail/config.hpp>
#include <stackroute/server/basic_router.hpp>
#include <stackroute/server/route_handler.hpp>

namespace stackroute {

/** The default router type using @ref route_params.
*/
using router = basic_router<route_params>;

} // stackroute

#endif
