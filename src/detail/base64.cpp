//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/base64.hpp"

namespace boost {
namespace csrf {
namespace detail {

namespace {

// rfc4648 section 5
constexpr char alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

} // (anon)

std::size_t
base64url_encode(
    char* dest,
    std::uint8_t const* src,
    std::size_t n) noexcept
{
    char* out = dest;

    for(; n >= 3; src += 3, n -= 3)
    {
        std::uint32_t const v =
            (static_cast<std::uint32_t>(src[0]) << 16) |
            (static_cast<std::uint32_t>(src[1]) << 8) |
            static_cast<std::uint32_t>(src[2]);

        *out++ = alphabet[(v >> 18) & 0x3F];
        *out++ = alphabet[(v >> 12) & 0x3F];
        *out++ = alphabet[(v >> 6) & 0x3F];
        *out++ = alphabet[v & 0x3F];
    }

    if(n == 0)
        return static_cast<std::size_t>(out - dest);

    // one or two trailing bytes, no padding
    std::uint32_t v =
        static_cast<std::uint32_t>(src[0]) << 16;
    if(n == 2)
        v |= static_cast<std::uint32_t>(src[1]) << 8;

    *out++ = alphabet[(v >> 18) & 0x3F];
    *out++ = alphabet[(v >> 12) & 0x3F];
    if(n == 2)
        *out++ = alphabet[(v >> 6) & 0x3F];

    return static_cast<std::size_t>(out - dest);
}

} // detail
} // csrf
} // boost
