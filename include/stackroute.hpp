//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STACKROUTE_HPP
#define STACKROUTE_HPP

#include <stackroute/error.hpp>
#include <stackroute/server/application.hpp>
#include <stackroute/server/basic_router.hpp>
#include <stackroute/server/route_handler.hpp>
#include <stackroute/server/router.hpp>
#include <stackroute/server/router_types.hpp>

#endif
