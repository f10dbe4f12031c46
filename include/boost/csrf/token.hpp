//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_TOKEN_HPP
#define BOOST_CSRF_TOKEN_HPP

#include <boost/csrf/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <string>

namespace boost {
namespace csrf {

/** The shortest cookie value accepted as an existing token.

    Shorter cookie values are treated as absent
    and cause a new token to be issued.
*/
constexpr std::size_t min_token_size = 16;

/** Generate a new random token.

    Draws `n` bytes from the operating system's
    cryptographically secure random source and
    returns them encoded as base64url without
    padding. The result has `(4 * n + 2) / 3`
    characters.

    @par Example
    @code
    std::string t = make_token( 32 );
    assert( t.size() == 43 );
    @endcode

    @param n The number of random bytes.

    @return The encoded token.

    @throw system::system_error The random source failed.
*/
BOOST_CSRF_DECL
std::string
make_token(std::size_t n);

/** Compare two tokens in constant time.

    When the sizes are equal, every byte of both
    strings is examined regardless of where the
    first difference occurs. Strings of different
    sizes compare unequal immediately; the size of
    a token is not secret.

    @return `true` if the strings are equal.
*/
BOOST_CSRF_DECL
bool
secure_compare(
    core::string_view a,
    core::string_view b) noexcept;

} // csrf
} // boost

#endif
