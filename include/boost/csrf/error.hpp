//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_ERROR_HPP
#define BOOST_CSRF_ERROR_HPP

#include <boost/csrf/detail/config.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/error_condition.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <boost/system/is_error_condition_enum.hpp>
#include <system_error>

namespace boost {
namespace csrf {

/** Error codes returned by request validation.

    Each value describes why an unsafe request
    was refused by the @ref protector.
*/
enum class error
{
    /// Success
    success = 0,

    /// Neither Origin nor Referer was presented
    no_origin,

    /// The Origin header names another host
    bad_origin,

    /// The Referer header names another host
    bad_referer,

    /// The request carried no client token
    missing_token,

    /// The client token does not match the cookie
    bad_token,

    /// No token is bound to the request
    no_token
};

/** Error conditions for request validation.
*/
enum class condition
{
    /** The declared origin of the request is not acceptable.

        Equivalent to @ref error::no_origin,
        @ref error::bad_origin and @ref error::bad_referer.
    */
    invalid_origin = 1
};

} // csrf

namespace system {
template<>
struct is_error_code_enum<
    ::boost::csrf::error>
{
    static bool const value = true;
};
template<>
struct is_error_condition_enum<
    ::boost::csrf::condition>
{
    static bool const value = true;
};
} // system
} // boost

namespace std {
template<>
struct is_error_code_enum<
    ::boost::csrf::error>
    : std::true_type {};
template<>
struct is_error_condition_enum<
    ::boost::csrf::condition>
    : std::true_type {};
} // std

namespace boost {
namespace csrf {

namespace detail {

struct BOOST_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    BOOST_CSRF_DECL const char* name(
        ) const noexcept override;
    BOOST_CSRF_DECL std::string message(
        int) const override;
    BOOST_CSRF_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x5c3f1e9b8d27a04c)
    {
    }
};

struct BOOST_SYMBOL_VISIBLE
    condition_cat_type
    : system::error_category
{
    BOOST_CSRF_DECL const char* name(
        ) const noexcept override;
    BOOST_CSRF_DECL std::string message(
        int) const override;
    BOOST_CSRF_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_CSRF_DECL bool equivalent(
        system::error_code const&,
        int) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR condition_cat_type()
        : error_category(0xa1e47d6c0b935f28)
    {
    }
};

BOOST_CSRF_DECL extern
    error_cat_type error_cat;
BOOST_CSRF_DECL extern
    condition_cat_type condition_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

inline
BOOST_SYSTEM_CONSTEXPR
system::error_condition
make_error_condition(
    condition c) noexcept
{
    return system::error_condition{
        static_cast<std::underlying_type<
            condition>::type>(c),
        detail::condition_cat};
}

} // csrf
} // boost

#endif
