//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_SRC_DETAIL_STRINGS_HPP
#define BOOST_CSRF_SRC_DETAIL_STRINGS_HPP

#include <boost/csrf/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/http/rfc/quoted_token_view.hpp>
#include <string>

namespace boost {
namespace csrf {
namespace detail {

inline
bool
is_ows(char c) noexcept
{
    return c == ' ' || c == '\t';
}

// Remove leading and trailing SP and HTAB
inline
core::string_view
trim_ows(core::string_view s) noexcept
{
    while(! s.empty() && is_ows(s.front()))
        s.remove_prefix(1);
    while(! s.empty() && is_ows(s.back()))
        s.remove_suffix(1);
    return s;
}

// Return the text of a token or quoted-string,
// with quoted-pairs replaced by the escaped octet
BOOST_CSRF_DECL
std::string
unquote(http::quoted_token_view v);

} // detail
} // csrf
} // boost

#endif
