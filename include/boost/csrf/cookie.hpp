//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_COOKIE_HPP
#define BOOST_CSRF_COOKIE_HPP

#include <boost/csrf/detail/config.hpp>
#include <boost/csrf/options.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/http/request.hpp>
#include <boost/optional.hpp>
#include <string>

namespace boost {
namespace csrf {

/** Return the value of a request cookie.

    All `Cookie` fields in the request are searched
    in order. Names are compared case-sensitively.
    A value enclosed in double quotes is returned
    without the quotes.

    @param req The request to search.

    @param name The cookie name.

    @return The value of the first cookie with the
    given name, or an empty optional.
*/
BOOST_CSRF_DECL
boost::optional<core::string_view>
find_cookie(
    http::request const& req,
    core::string_view name);

/** Return a Set-Cookie field value for the token cookie.

    The cookie attributes are taken from the
    `cookie_` members of the options. Attributes
    which are empty, zero, or false are omitted,
    except SameSite which is always present. A
    negative max age is written as `Max-Age=0`.

    @par Example
    @code
    csrf_options opts = apply_defaults( {} );
    // "csrf_token=abc; Path=/; SameSite=Lax"
    std::string s = make_set_cookie( opts, "abc" );
    @endcode

    @param opts The options with defaults applied.

    @param value The cookie value.
*/
BOOST_CSRF_DECL
std::string
make_set_cookie(
    csrf_options const& opts,
    core::string_view value);

} // csrf
} // boost

#endif
