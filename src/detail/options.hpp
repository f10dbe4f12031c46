//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_SRC_DETAIL_OPTIONS_HPP
#define BOOST_CSRF_SRC_DETAIL_OPTIONS_HPP

#include <boost/csrf/options.hpp>

namespace boost {
namespace csrf {
namespace detail {

// Apply defaults, then validate.
// Throws std::invalid_argument on failure.
csrf_options
make_options(csrf_options opts);

} // detail
} // csrf
} // boost

#endif
