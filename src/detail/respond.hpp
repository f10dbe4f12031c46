//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_SRC_DETAIL_RESPOND_HPP
#define BOOST_CSRF_SRC_DETAIL_RESPOND_HPP

#include <boost/csrf/detail/config.hpp>
#include <boost/http/server/router.hpp>
#include <boost/http/status.hpp>
#include <string>

namespace boost {
namespace csrf {
namespace detail {

// Send a complete plain text response
http::route_task
respond(
    http::route_params& rp,
    http::status code,
    std::string body);

} // detail
} // csrf
} // boost

#endif
