//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/csrf/extract.hpp>
#include "src/detail/multipart.hpp"
#include "src/detail/strings.hpp"
#include <boost/http/field.hpp>
#include <boost/http/rfc/media_type.hpp>
#include <boost/url/encoding_opts.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/url/pct_string_view.hpp>

namespace boost {
namespace csrf {

namespace {

// application/x-www-form-urlencoded, which is
// also the encoding of an HTML form's query.
// A malformed pair does not hide the others.
boost::optional<std::string>
find_urlencoded(
    core::string_view s,
    core::string_view name)
{
    urls::encoding_opts opt;
    opt.space_as_plus = true;
    while(! s.empty())
    {
        core::string_view pair;
        auto const amp = s.find('&');
        if(amp == core::string_view::npos)
        {
            pair = s;
            s = {};
        }
        else
        {
            pair = s.substr(0, amp);
            s.remove_prefix(amp + 1);
        }

        auto const eq = pair.find('=');
        if(eq == core::string_view::npos)
            continue;
        auto const key = urls::make_pct_string_view(
            pair.substr(0, eq));
        if(! key)
            continue;
        if(core::string_view(key->decode(opt)) != name)
            continue;
        auto const value = urls::make_pct_string_view(
            pair.substr(eq + 1));
        if(! value)
            continue;
        auto v = value->decode(opt);
        if(v.empty())
            continue;
        return v;
    }
    return boost::none;
}

enum class form_kind
{
    none,
    urlencoded,
    multipart
};

// Return the form encoding named by a Content-Type.
// The multipart boundary is stored in `boundary`.
form_kind
parse_content_type(
    core::string_view ct,
    std::string& boundary)
{
    auto rv = grammar::parse(ct, http::media_type_rule);
    if(! rv)
        return form_kind::none;
    auto const& mime = rv->mime;
    if( grammar::ci_is_equal(mime.type, "application") &&
        grammar::ci_is_equal(mime.subtype, "x-www-form-urlencoded"))
        return form_kind::urlencoded;
    if( ! grammar::ci_is_equal(mime.type, "multipart") ||
        ! grammar::ci_is_equal(mime.subtype, "form-data"))
        return form_kind::none;
    for(auto p : rv->params)
    {
        if(! grammar::ci_is_equal(p.name, "boundary"))
            continue;
        boundary = detail::unquote(p.value);
        if(boundary.empty())
            return form_kind::none;
        return form_kind::multipart;
    }
    return form_kind::none;
}

} // (anon)

boost::optional<std::string>
find_form_value(
    http::request const& req,
    urls::url_view const& target,
    boost::optional<core::string_view> body,
    core::string_view name)
{
    if(body && ! body->empty())
    {
        std::string boundary;
        boost::optional<std::string> v;
        switch(parse_content_type(req.value_or(
            http::field::content_type, ""), boundary))
        {
        case form_kind::urlencoded:
            v = find_urlencoded(*body, name);
            break;
        case form_kind::multipart:
            v = detail::find_multipart_field(
                *body, boundary, name);
            break;
        case form_kind::none:
            break;
        }
        if(v)
            return v;
    }

    if(target.has_query())
        return find_urlencoded(
            target.encoded_query(), name);
    return boost::none;
}

boost::optional<std::string>
extract_client_token(
    http::request const& req,
    urls::url_view const& target,
    boost::optional<core::string_view> body,
    core::string_view header_name,
    core::string_view form_field)
{
    auto it = req.find(header_name);
    if(it != req.end() && ! it->value.empty())
        return std::string(it->value);
    return find_form_value(
        req, target, body, form_field);
}

} // csrf
} // boost
