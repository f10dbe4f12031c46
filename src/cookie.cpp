//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/csrf/cookie.hpp>
#include "src/detail/strings.hpp"
#include <boost/http/field.hpp>

namespace boost {
namespace csrf {

namespace {

// Search one Cookie field value
// cookie-string = cookie-pair *( ";" SP cookie-pair )
boost::optional<core::string_view>
find_in(
    core::string_view s,
    core::string_view name)
{
    while(! s.empty())
    {
        core::string_view pair;
        auto const semi = s.find(';');
        if(semi == core::string_view::npos)
        {
            pair = s;
            s = {};
        }
        else
        {
            pair = s.substr(0, semi);
            s.remove_prefix(semi + 1);
        }

        pair = detail::trim_ows(pair);
        auto const eq = pair.find('=');
        if(eq == core::string_view::npos)
            continue;
        if(detail::trim_ows(pair.substr(0, eq)) != name)
            continue;

        auto v = detail::trim_ows(pair.substr(eq + 1));
        if( v.size() >= 2 &&
            v.front() == '"' &&
            v.back() == '"')
        {
            v.remove_prefix(1);
            v.remove_suffix(1);
        }
        return v;
    }
    return boost::none;
}

} // (anon)

boost::optional<core::string_view>
find_cookie(
    http::request const& req,
    core::string_view name)
{
    for(auto const& f : req)
    {
        if(f.id != http::field::cookie)
            continue;
        auto v = find_in(f.value, name);
        if(v)
            return v;
    }
    return boost::none;
}

std::string
make_set_cookie(
    csrf_options const& opts,
    core::string_view value)
{
    std::string s;
    s.reserve(
        opts.cookie_name.size() + value.size() +
        opts.cookie_path.size() + opts.cookie_domain.size() +
        64);

    s.append(opts.cookie_name);
    s.push_back('=');
    s.append(value.data(), value.size());

    if(! opts.cookie_path.empty())
    {
        s.append("; Path=");
        s.append(opts.cookie_path);
    }
    if(! opts.cookie_domain.empty())
    {
        s.append("; Domain=");
        s.append(opts.cookie_domain);
    }
    if(opts.cookie_max_age.count() > 0)
    {
        s.append("; Max-Age=");
        s.append(std::to_string(
            opts.cookie_max_age.count()));
    }
    else if(opts.cookie_max_age.count() < 0)
    {
        // expire now
        s.append("; Max-Age=0");
    }
    if(opts.cookie_http_only)
        s.append("; HttpOnly");
    if(opts.cookie_secure)
        s.append("; Secure");

    auto const ss = to_string(opts.cookie_same_site);
    s.append("; SameSite=");
    s.append(ss.data(), ss.size());
    return s;
}

} // csrf
} // boost
