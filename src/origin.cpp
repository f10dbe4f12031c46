//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/csrf/origin.hpp>
#include <boost/http/field.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <boost/url/parse.hpp>

namespace boost {
namespace csrf {

namespace {

bool
same_host(
    core::string_view s,
    core::string_view host)
{
    if(host.empty())
        return false;
    auto rv = urls::parse_uri_reference(s);
    if(! rv)
        return false;
    core::string_view const hp =
        rv->encoded_host_and_port();
    if(hp.empty())
        return false;
    return grammar::ci_is_equal(hp, host);
}

} // (anon)

system::error_code
check_origin(
    core::string_view origin,
    core::string_view referer,
    core::string_view host,
    core::string_view allowed)
{
    if(! allowed.empty())
        host = allowed;

    if(origin.empty() && referer.empty())
        return BOOST_CSRF_ERR(error::no_origin);
    if(! origin.empty())
    {
        if(! same_host(origin, host))
            return BOOST_CSRF_ERR(error::bad_origin);
        return {};
    }
    if(! same_host(referer, host))
        return BOOST_CSRF_ERR(error::bad_referer);
    return {};
}

system::error_code
check_origin(
    http::request const& req,
    core::string_view allowed)
{
    return check_origin(
        req.value_or(http::field::origin, ""),
        req.value_or(http::field::referer, ""),
        req.value_or(http::field::host, ""),
        allowed);
}

} // csrf
} // boost
