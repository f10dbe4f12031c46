//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_HPP
#define BOOST_CSRF_HPP

#include <boost/csrf/context.hpp>
#include <boost/csrf/cookie.hpp>
#include <boost/csrf/error.hpp>
#include <boost/csrf/extract.hpp>
#include <boost/csrf/options.hpp>
#include <boost/csrf/origin.hpp>
#include <boost/csrf/protector.hpp>
#include <boost/csrf/token.hpp>
#include <boost/csrf/token_handler.hpp>

#endif
