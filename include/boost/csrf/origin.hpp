//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_ORIGIN_HPP
#define BOOST_CSRF_ORIGIN_HPP

#include <boost/csrf/detail/config.hpp>
#include <boost/csrf/error.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/http/request.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace csrf {

/** Check the declared origin of a request.

    The host and port of `origin` is compared to
    the allowed host. When `origin` is empty, the
    host and port of `referer` is compared instead.
    Comparison is case-insensitive and exact: a
    subdomain does not match its parent.

    The allowed host is `allowed` if it is not
    empty, otherwise `host`.

    @par Example
    @code
    auto ec = check_origin(
        "https://example.com", "", "example.com", "" );
    assert( ! ec.failed() );
    @endcode

    @param origin The value of the Origin header, or empty.

    @param referer The value of the Referer header, or empty.

    @param host The value of the request's Host header.

    @param allowed The configured allowed host, or empty.

    @return An error code with one of these values:
    @li @ref error::no_origin if both `origin` and `referer` are empty,
    @li @ref error::bad_origin if `origin` does not match,
    @li @ref error::bad_referer if `referer` does not match.
    A URL which fails to parse never matches.
*/
BOOST_CSRF_DECL
system::error_code
check_origin(
    core::string_view origin,
    core::string_view referer,
    core::string_view host,
    core::string_view allowed);

/** Check the declared origin of a request.

    Reads the Origin, Referer and Host fields
    of `req` and calls the four-argument overload.
*/
BOOST_CSRF_DECL
system::error_code
check_origin(
    http::request const& req,
    core::string_view allowed);

} // csrf
} // boost

#endif
