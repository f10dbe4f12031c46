//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/csrf/error.hpp>

namespace boost {
namespace csrf {
namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "boost.csrf";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::success: return "success";
    case error::no_origin: return "no origin information";
    case error::bad_origin: return "bad origin";
    case error::bad_referer: return "bad referer";
    case error::missing_token: return "missing CSRF token";
    case error::bad_token: return "bad CSRF token";
    case error::no_token: return "no token";
    default:
        return "unknown";
    }
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "boost.csrf";
}

std::string
condition_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(ev))
    {
    case condition::invalid_origin:
        return "invalid origin";
    default:
        return "unknown";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int ev) const noexcept
{
    switch(static_cast<condition>(ev))
    {
    case condition::invalid_origin:
        return
            ec == error::no_origin ||
            ec == error::bad_origin ||
            ec == error::bad_referer;
    default:
        return false;
    }
}

//-----------------------------------------------

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

} // detail
} // csrf
} // boost
