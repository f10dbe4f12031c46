//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/csrf/token.hpp>
#include "src/detail/base64.hpp"
#include "src/detail/random.hpp"
#include <cstdint>
#include <vector>

namespace boost {
namespace csrf {

std::string
make_token(std::size_t n)
{
    std::vector<std::uint8_t> raw(n);
    detail::fill_random(raw.data(), raw.size());

    std::string s;
    s.resize(detail::base64url_encoded_size(n));
    auto const used = detail::base64url_encode(
        &s[0], raw.data(), raw.size());
    s.resize(used);
    return s;
}

bool
secure_compare(
    core::string_view a,
    core::string_view b) noexcept
{
    if(a.size() != b.size())
        return false;
    volatile std::uint8_t result = 0;
    for(std::size_t i = 0; i < a.size(); ++i)
    {
        result = static_cast<std::uint8_t>(result |
            (static_cast<std::uint8_t>(a[i]) ^
             static_cast<std::uint8_t>(b[i])));
    }
    return result == 0;
}

} // csrf
} // boost
