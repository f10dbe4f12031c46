//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_DETAIL_CONFIG_HPP
#define BOOST_CSRF_DETAIL_CONFIG_HPP

#include <boost/config.hpp>

namespace boost {

namespace csrf {

//------------------------------------------------

# if (defined(BOOST_CSRF_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_CSRF_STATIC_LINK)
#  if defined(BOOST_CSRF_SOURCE)
#   define BOOST_CSRF_DECL        BOOST_SYMBOL_EXPORT
#   define BOOST_CSRF_BUILD_DLL
#  else
#   define BOOST_CSRF_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  BOOST_CSRF_DECL
#  define BOOST_CSRF_DECL
# endif

#if defined(__MINGW32__)
    #define BOOST_CSRF_SYMBOL_VISIBLE BOOST_CSRF_DECL
#else
    #define BOOST_CSRF_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

# if !defined(BOOST_CSRF_SOURCE) && !defined(BOOST_ALL_NO_LIB) && !defined(BOOST_CSRF_NO_LIB)
#  define BOOST_LIB_NAME boost_csrf
#  if defined(BOOST_ALL_DYN_LINK) || defined(BOOST_CSRF_DYN_LINK)
#   define BOOST_DYN_LINK
#  endif
#  include <boost/config/auto_link.hpp>
# endif

//-----------------------------------------------

// Add source location to error codes
#ifdef BOOST_CSRF_NO_SOURCE_LOCATION
# define BOOST_CSRF_ERR(ev) (::boost::system::error_code(ev))
#else
# define BOOST_CSRF_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
#endif

} // csrf

// lift grammar into our namespace
namespace urls {
namespace grammar {}
}
namespace csrf {
namespace grammar = ::boost::urls::grammar;
} // csrf

} // boost

#endif
