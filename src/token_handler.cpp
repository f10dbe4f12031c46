//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/csrf/token_handler.hpp>
#include <boost/csrf/context.hpp>
#include <boost/csrf/error.hpp>
#include "src/detail/respond.hpp"
#include <boost/http/status.hpp>

namespace boost {
namespace csrf {

http::route_task
token_handler::
operator()(http::route_params& rp) const
{
    auto const t = find_token(rp.route_data);
    if(! t)
    {
        system::error_code ec = error::no_token;
        co_return co_await detail::respond(rp,
            http::status::internal_server_error,
            ec.message());
    }
    co_return co_await detail::respond(rp,
        http::status::ok, std::string(*t));
}

} // csrf
} // boost
