//
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CSRF_SRC_DETAIL_MULTIPART_HPP
#define BOOST_CSRF_SRC_DETAIL_MULTIPART_HPP

#include <boost/csrf/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional.hpp>
#include <string>

namespace boost {
namespace csrf {
namespace detail {

// Return the content of the first non-empty text
// part of a complete multipart/form-data body whose
// name matches. Parts with a filename are skipped.
// Returns none if the body is malformed.
BOOST_CSRF_DECL
boost::optional<std::string>
find_multipart_field(
    core::string_view body,
    core::string_view boundary,
    core::string_view name);

} // detail
} // csrf
} // boost

#endif
