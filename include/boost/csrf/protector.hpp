//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_PROTECTOR_HPP
#define BOOST_CSRF_PROTECTOR_HPP

#include <boost/csrf/detail/config.hpp>
#include <boost/csrf/options.hpp>
#include <boost/http/method.hpp>
#include <boost/http/server/router.hpp>
#include <type_traits>
#include <utility>

namespace boost {
namespace csrf {

template<class Handler>
class protected_handler;

/** Return true if requests with this method are validated.

    The unsafe methods are POST, PUT, PATCH
    and DELETE. All other methods, including
    unknown ones, are safe.
*/
BOOST_CSRF_DECL
bool
is_unsafe_method(http::method m) noexcept;

/** CSRF middleware using the double-submit cookie pattern.

    For every request the protector makes sure the
    client holds a token cookie, issuing a new random
    token if the request carries none. The token is
    bound to the request, where later handlers can
    obtain it with @ref find_token.

    Requests with an unsafe method must also present
    the same token in a header or form field, and
    when @ref csrf_options::enforce_origin is set,
    must declare an allowed origin. Requests which
    fail validation receive a response and are not
    seen by later handlers:

    @li 500 "failed to set CSRF cookie" if no token
        could be generated,
    @li 403 "invalid origin",
    @li 403 "missing CSRF token",
    @li 403 "bad CSRF token".

    Form fields are read from the request body and
    then the query. The body is the @ref request_body
    stored in the route data if there is one, else
    the body held by `route_params::parser` once the
    parser has read the complete message.

    @par Example
    @code
    csrf_options opts;
    opts.cookie_secure = true;
    opts.enforce_origin = true;

    router.use( csrf::protector( opts ) );
    router.add( http::method::get, "/csrf-token", csrf::token_handler() );
    @endcode

    @par Thread Safety
    Distinct requests may be processed concurrently
    by the same protector.

    @see csrf_options, token_handler
*/
class BOOST_CSRF_DECL protector
{
    csrf_options options_;

public:
    /** Construct a CSRF middleware.

        Defaults are applied as if by
        @ref apply_defaults.

        @param options Configuration options.

        @throw std::invalid_argument A name, path or
        domain contains characters which cannot appear
        in its header.
    */
    explicit protector(csrf_options options = {});

    /** Return the options in use, with defaults applied.
    */
    csrf_options const&
    options() const noexcept
    {
        return options_;
    }

    /** Handle a request.

        @param rp The route parameters.

        @return A task that completes with @ref http::route::next
        when the request may proceed, or with the result of
        sending the rejection.
    */
    http::route_task operator()(http::route_params& rp) const;

    /** Return a handler which runs only for accepted requests.

        The returned handler invokes this protector
        and then, if the request was accepted, `next`.

        @par Example
        @code
        router.add( http::method::post, "/transfer",
            csrf::protector().protect( do_transfer ) );
        @endcode

        @param next A route handler invocable as
        `http::route_task( http::route_params& ) const`.
    */
    template<class Handler>
    protected_handler<typename std::decay<Handler>::type>
    protect(Handler&& next) const
    {
        return protected_handler<
            typename std::decay<Handler>::type>(
                *this, std::forward<Handler>(next));
    }
};

//------------------------------------------------

/** A route handler guarded by a protector.

    @see protector::protect
*/
template<class Handler>
class protected_handler
{
    protector p_;
    Handler h_;

public:
    protected_handler(
        protector p,
        Handler h)
        : p_(std::move(p))
        , h_(std::move(h))
    {
    }

    http::route_task operator()(http::route_params& rp) const
    {
        auto rv = co_await p_(rp);
        if(rv != http::route::next)
            co_return rv;
        co_return co_await h_(rp);
    }
};

} // csrf
} // boost

#endif
