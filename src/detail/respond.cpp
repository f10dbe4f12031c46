//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/respond.hpp"
#include <boost/http/field.hpp>

namespace boost {
namespace csrf {
namespace detail {

http::route_task
respond(
    http::route_params& rp,
    http::status code,
    std::string body)
{
    rp.res.set_status(code);
    rp.res.set(http::field::content_type,
        "text/plain; charset=utf-8");
    rp.res.set("X-Content-Type-Options", "nosniff");
    co_return co_await rp.send(body);
}

} // detail
} // csrf
} // boost
