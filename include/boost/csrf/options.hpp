//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_OPTIONS_HPP
#define BOOST_CSRF_OPTIONS_HPP

#include <boost/csrf/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace boost {
namespace csrf {

/** SameSite attribute values for the token cookie.
*/
enum class same_site
{
    /** Sent on top-level navigations and same-site requests */
    lax,

    /** Sent on same-site requests only */
    strict,

    /** Sent on all requests. Browsers require Secure */
    none
};

/** Return the attribute text for a SameSite value.
*/
BOOST_CSRF_DECL
core::string_view
to_string(same_site v) noexcept;

/** Options for CSRF middleware configuration.

    Fields left empty or zero are replaced by
    the defaults listed for each field when the
    @ref protector is constructed.

    @note The token cookie is readable by scripts
    unless @ref cookie_http_only is set. This is what
    the double-submit pattern expects. It offers no
    protection against script injection on the
    protected origin, which can read the token
    either way.

    @see protector, apply_defaults
*/
struct csrf_options
{
    /// Name of the token cookie. Default "csrf_token".
    std::string cookie_name;

    /// Path attribute of the token cookie. Default "/".
    std::string cookie_path;

    /// Domain attribute. Empty omits the attribute.
    std::string cookie_domain;

    /// If true, the cookie carries the Secure flag.
    bool cookie_secure = false;

    /// If true, the cookie carries the HttpOnly flag.
    bool cookie_http_only = false;

    /// SameSite attribute of the token cookie.
    same_site cookie_same_site = same_site::lax;

    /** Max-Age attribute.

        Zero omits the attribute, making a session
        cookie. A negative value emits `Max-Age=0`,
        which tells the client to delete the cookie.
    */
    std::chrono::seconds cookie_max_age{ 0 };

    /// Request header carrying the client token. Default "X-CSRF-Token".
    std::string header_name;

    /// Form field carrying the client token. Default "csrf_token".
    std::string form_field;

    /// If true, unsafe requests must come from the allowed host.
    bool enforce_origin = false;

    /// Allowed host (and port). Empty means the request's own Host.
    std::string allowed_origin;

    /// Random bytes per token. Default 32.
    std::size_t token_bytes = 0;
};

/** Return a copy of the options with defaults applied.

    @par Example
    @code
    csrf_options opts = apply_defaults( {} );
    assert( opts.cookie_name == "csrf_token" );
    assert( opts.token_bytes == 32 );
    @endcode
*/
BOOST_CSRF_DECL
csrf_options
apply_defaults(csrf_options opts);

} // csrf
} // boost

#endif
