//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/csrf/protector.hpp>
#include <boost/csrf/context.hpp>
#include <boost/csrf/cookie.hpp>
#include <boost/csrf/error.hpp>
#include <boost/csrf/extract.hpp>
#include <boost/csrf/origin.hpp>
#include <boost/csrf/token.hpp>
#include "src/detail/options.hpp"
#include "src/detail/respond.hpp"
#include <boost/http/field.hpp>
#include <boost/http/status.hpp>
#include <boost/system/system_error.hpp>
#include <spdlog/spdlog.h>
#include <string_view>

namespace boost {
namespace csrf {

namespace {

constexpr http::method unsafe_methods[] = {
    http::method::post,
    http::method::put,
    http::method::patch,
    http::method::delete_
};

void
log_rejected(
    http::route_params const& rp,
    core::string_view reason)
{
    SPDLOG_DEBUG(
        "csrf: rejected {} {}: {}",
        std::string_view(rp.req.method_text()),
        std::string_view(rp.req.target()),
        std::string_view(reason));
}

} // (anon)

bool
is_unsafe_method(http::method m) noexcept
{
    for(auto u : unsafe_methods)
        if(m == u)
            return true;
    return false;
}

protector::
protector(
    csrf_options options)
    : options_(detail::make_options(
        std::move(options)))
{
}

http::route_task
protector::
operator()(
    http::route_params& rp) const
{
    // make sure the client holds a token
    std::string token;
    auto const cookie = find_cookie(
        rp.req, options_.cookie_name);
    if(cookie && cookie->size() >= min_token_size)
    {
        token.assign(cookie->data(), cookie->size());
    }
    else
    {
        bool failed = false;
        try
        {
            token = make_token(options_.token_bytes);
        }
        catch(system::system_error const& e)
        {
            SPDLOG_ERROR(
                "csrf: token generation failed: {}",
                e.what());
            failed = true;
        }
        if(failed)
            co_return co_await detail::respond(rp,
                http::status::internal_server_error,
                "failed to set CSRF cookie");
        rp.res.append(http::field::set_cookie,
            make_set_cookie(options_, token));
    }

    bind_token(rp.route_data, token);

    if(! is_unsafe_method(rp.req.method()))
        co_return http::route::next;

    if(options_.enforce_origin)
    {
        auto const ec = check_origin(
            rp.req, options_.allowed_origin);
        if(ec.failed())
        {
            log_rejected(rp, ec.message());
            co_return co_await detail::respond(rp,
                http::status::forbidden,
                make_error_condition(
                    condition::invalid_origin).message());
        }
    }

    boost::optional<core::string_view> body;
    if(auto* rb = rp.route_data.find<request_body>())
        body = core::string_view(rb->data);
    else if(rp.parser.is_complete())
        body = rp.parser.body();

    auto const presented = extract_client_token(
        rp.req, rp.url, body,
        options_.header_name,
        options_.form_field);
    if(! presented)
    {
        system::error_code ec = error::missing_token;
        log_rejected(rp, ec.message());
        co_return co_await detail::respond(rp,
            http::status::forbidden, ec.message());
    }

    if(! secure_compare(*presented, token))
    {
        system::error_code ec = error::bad_token;
        log_rejected(rp, ec.message());
        co_return co_await detail::respond(rp,
            http::status::forbidden, ec.message());
    }

    co_return http::route::next;
}

} // csrf
} // boost
