//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_TOKEN_HANDLER_HPP
#define BOOST_CSRF_TOKEN_HANDLER_HPP

#include <boost/csrf/detail/config.hpp>
#include <boost/http/server/router.hpp>

namespace boost {
namespace csrf {

/** Route handler which sends the current token.

    The response is 200 with a `text/plain` body
    holding the token bound by a @ref protector
    earlier in the route. If no token is bound,
    the response is 500 with the body "no token".

    This allows script running in a single page
    application to fetch the token.

    @par Example
    @code
    router.use( csrf::protector() );
    router.add( http::method::get, "/csrf-token", csrf::token_handler() );
    @endcode
*/
struct token_handler
{
    BOOST_CSRF_DECL
    http::route_task operator()(http::route_params& rp) const;
};

} // csrf
} // boost

#endif
