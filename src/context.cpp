//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/csrf/context.hpp>

namespace boost {
namespace csrf {

namespace {

// The datastore is keyed by type. This type is
// not visible outside this translation unit.
struct bound_token
{
    std::string value;
};

} // (anon)

void
bind_token(
    http::datastore& data,
    core::string_view token)
{
    auto& bt = data.try_emplace<bound_token>();
    bt.value.assign(token.data(), token.size());
}

boost::optional<core::string_view>
find_token(
    http::datastore& data) noexcept
{
    auto* bt = data.find<bound_token>();
    if(! bt)
        return boost::none;
    return core::string_view(bt->value);
}

} // csrf
} // boost
