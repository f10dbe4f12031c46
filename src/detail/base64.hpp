//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_SRC_DETAIL_BASE64_HPP
#define BOOST_CSRF_SRC_DETAIL_BASE64_HPP

#include <boost/csrf/detail/config.hpp>
#include <cstddef>
#include <cstdint>

namespace boost {
namespace csrf {
namespace detail {

// Number of characters produced for n input bytes.
constexpr
std::size_t
base64url_encoded_size(std::size_t n) noexcept
{
    return (n / 3) * 4 + (n % 3 == 0 ? 0 : n % 3 + 1);
}

// Encode using the URL and filename safe
// alphabet of rfc4648 without padding.
// Returns number of characters written.
BOOST_CSRF_DECL
std::size_t
base64url_encode(
    char* dest,
    std::uint8_t const* src,
    std::size_t n) noexcept;

} // detail
} // csrf
} // boost

#endif
