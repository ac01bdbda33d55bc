//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STACKROUTE_DETAIL_CONFIG_HPP
#define STACKROUTE_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <stdint.h>

namespace stackroute {

//------------------------------------------------

# if (defined(STACKROUTE_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(STACKROUTE_STATIC_LINK)
#  if defined(STACKROUTE_SOURCE)
#   define STACKROUTE_DECL        BOOST_SYMBOL_EXPORT
#   define STACKROUTE_BUILD_DLL
#  else
#   define STACKROUTE_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  STACKROUTE_DECL
#  define STACKROUTE_DECL
# endif

#if defined(__MINGW32__)
    #define STACKROUTE_SYMBOL_VISIBLE STACKROUTE_DECL
#else
    #define STACKROUTE_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

//-----------------------------------------------

} // stackroute

// lift the Boost libraries we build on into our namespace
namespace boost {
namespace system {}
namespace urls {
namespace grammar {}
}
namespace beast {
namespace http {}
}
} // boost

namespace stackroute {
namespace system = ::boost::system;
namespace urls = ::boost::urls;
namespace grammar = ::boost::urls::grammar;
namespace http = ::boost::beast::http;
} // stackroute

#endif
