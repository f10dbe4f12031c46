//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_CONTEXT_HPP
#define BOOST_CSRF_CONTEXT_HPP

#include <boost/csrf/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/http/datastore.hpp>
#include <boost/optional.hpp>
#include <string>

namespace boost {
namespace csrf {

/** A buffered request body.

    When an object of this type is present in the
    request's `route_params::route_data`, the
    @ref protector reads form fields from it instead
    of from `route_params::parser`. A handler which
    has consumed the body from the parser, for
    example into a sink, stores a copy here.

    @par Example
    @code
    rp.route_data.try_emplace< csrf::request_body >().data =
        std::move( body );
    @endcode
*/
struct request_body
{
    /// The complete body, without transfer coding
    std::string data;
};

/** Bind a token to a request.

    Replaces any token already bound.

    @param data The request's `route_params::route_data`.

    @param token The token value.
*/
BOOST_CSRF_DECL
void
bind_token(
    http::datastore& data,
    core::string_view token);

/** Return the token bound to a request.

    @par Example
    @code
    route_task render_form( route_params& rp )
    {
        auto t = csrf::find_token( rp.route_data );
        if(! t)
            co_return route::next;
        // ...
    }
    @endcode

    @param data The request's `route_params::route_data`.

    @return The token, or an empty optional if no
    @ref protector has processed this request.
*/
BOOST_CSRF_DECL
boost::optional<core::string_view>
find_token(
    http::datastore& data) noexcept;

} // csrf
} // boost

#endif
