//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/strings.hpp"
#include <iterator>

namespace boost {
namespace csrf {
namespace detail {

std::string
unquote(http::quoted_token_view v)
{
    if(! v.has_escapes())
        return std::string(v.begin(), v.end());

    std::string s;
    s.reserve(v.unescaped_size());
    for(auto it = v.begin(); it != v.end(); ++it)
    {
        if(*it == '\\' && std::next(it) != v.end())
            ++it;
        s.push_back(*it);
    }
    return s;
}

} // detail
} // csrf
} // boost
