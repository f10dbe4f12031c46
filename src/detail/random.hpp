//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_SRC_DETAIL_RANDOM_HPP
#define BOOST_CSRF_SRC_DETAIL_RANDOM_HPP

#include <boost/csrf/detail/config.hpp>
#include <cstddef>

namespace boost {
namespace csrf {
namespace detail {

using random_source = void(*)(void*, std::size_t);

// Fill buffer with cryptographically secure random bytes.
// Throws system_error on failure.
void
fill_random(void* buf, std::size_t n);

// Replace the source used by fill_random.
// A null source restores the operating system's.
BOOST_CSRF_DECL
void
set_random_source(random_source f) noexcept;

} // detail
} // csrf
} // boost

#endif
