//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_EXTRACT_HPP
#define BOOST_CSRF_EXTRACT_HPP

#include <boost/csrf/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/http/request.hpp>
#include <boost/optional.hpp>
#include <boost/url/url_view.hpp>
#include <string>

namespace boost {
namespace csrf {

/** Return the value of a form field.

    The body is searched first, then the query
    of the request target. The body is searched
    only when the request's Content-Type is one of:

    @li `application/x-www-form-urlencoded`, or
    @li `multipart/form-data` with a boundary.

    Multipart parts which carry a filename are
    skipped. A body which cannot be parsed is
    treated as if it contained no fields.

    @param req The request, for its Content-Type.

    @param target The request target.

    @param body The request body, or an empty
    optional if the body is not available.

    @param name The decoded field name.

    @return The decoded value of the first non-empty
    field with the given name, or an empty optional.
*/
BOOST_CSRF_DECL
boost::optional<std::string>
find_form_value(
    http::request const& req,
    urls::url_view const& target,
    boost::optional<core::string_view> body,
    core::string_view name);

/** Return the token presented by the client.

    The header named `header_name` is used if it
    is present and not empty. Otherwise the form
    field `form_field` is looked up as if by
    @ref find_form_value.

    @return The presented token, or an empty
    optional if none was found.
*/
BOOST_CSRF_DECL
boost::optional<std::string>
extract_client_token(
    http::request const& req,
    urls::url_view const& target,
    boost::optional<core::string_view> body,
    core::string_view header_name,
    core::string_view form_field);

} // csrf
} // boost

#endif
