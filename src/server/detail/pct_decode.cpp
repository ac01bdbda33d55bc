//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/server/detail/pct_decode.hpp"
#include <boost/url/grammar/hexdig_chars.hpp>

namespace stackroute {
namespace detail {

std::string
pct_decode(
    urls::pct_string_view s,
    bool keep_separators)
{
    // decoding never grows the string
    std::string out;
    out.reserve(s.decoded_size());

    char const* const end = s.data() + s.size();
    for(char const* it = s.data(); it != end;)
    {
        if(*it != '%')
        {
            out.push_back(*it++);
            continue;
        }

        // the escape was validated when `s` was made
        char const c = static_cast<char>(
            grammar::hexdig_value(it[1]) * 16 +
            grammar::hexdig_value(it[2]));
        if( keep_separators &&
            (c == '/' || c == '\\'))
            out.append(it, 3);
        else
            out.push_back(c);
        it += 3;
    }
    return out;
}

} // detail
} // stackroute
