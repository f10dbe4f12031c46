//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_DETAIL_EXCEPT_HPP
#define BOOST_CSRF_DETAIL_EXCEPT_HPP

#include <boost/csrf/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace csrf {
namespace detail {

BOOST_CSRF_DECL
[[noreturn]]
void
throw_invalid_argument(
    char const* what,
    source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_CSRF_DECL
[[noreturn]]
void
throw_system_error(
    system::error_code const& ec,
    source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // csrf
} // boost

#endif
