//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/csrf/options.hpp>
#include <boost/csrf/detail/except.hpp>
#include "src/detail/options.hpp"
#include <boost/http/rfc/token_rule.hpp>
#include <boost/url/grammar/parse.hpp>
#include <spdlog/spdlog.h>

namespace boost {
namespace csrf {

core::string_view
to_string(same_site v) noexcept
{
    switch(v)
    {
    case same_site::lax: return "Lax";
    case same_site::strict: return "Strict";
    case same_site::none: return "None";
    }
    return "Lax";
}

csrf_options
apply_defaults(csrf_options opts)
{
    if(opts.cookie_name.empty())
        opts.cookie_name = "csrf_token";
    if(opts.cookie_path.empty())
        opts.cookie_path = "/";
    if(opts.header_name.empty())
        opts.header_name = "X-CSRF-Token";
    if(opts.form_field.empty())
        opts.form_field = "csrf_token";
    if(opts.token_bytes == 0)
        opts.token_bytes = 32;
    return opts;
}

namespace detail {

namespace {

// token from rfc7230
bool
is_token(core::string_view s) noexcept
{
    return grammar::parse(s, http::token_rule).has_value();
}

bool
is_attr_value(core::string_view s) noexcept
{
    for(char c : s)
    {
        auto const u = static_cast<unsigned char>(c);
        if(u < 0x20 || u == 0x7f || c == ';')
            return false;
    }
    return true;
}

} // (anon)

csrf_options
make_options(csrf_options opts)
{
    opts = apply_defaults(std::move(opts));

    if(! is_token(opts.cookie_name))
        throw_invalid_argument(
            "csrf_options::cookie_name");
    if(! is_token(opts.header_name))
        throw_invalid_argument(
            "csrf_options::header_name");
    if(! is_attr_value(opts.form_field))
        throw_invalid_argument(
            "csrf_options::form_field");
    if(! is_attr_value(opts.cookie_path))
        throw_invalid_argument(
            "csrf_options::cookie_path");
    if(! is_attr_value(opts.cookie_domain))
        throw_invalid_argument(
            "csrf_options::cookie_domain");

    // 12 bytes encode to 16 characters
    if(opts.token_bytes < 12)
        SPDLOG_WARN(
            "csrf: token_bytes={} is below the cookie "
            "length minimum, tokens are reissued per request",
            opts.token_bytes);

    return opts;
}

} // detail

} // csrf
} // boost
