//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/csrf/token_handler.hpp>

#include <boost/csrf/context.hpp>
#include <boost/csrf/protector.hpp>
#include <boost/http/field.hpp>
#include <boost/http/status.hpp>
#include <boost/core/lightweight_test.hpp>

#include "test_route_params.hpp"

#include <string>

namespace boost {
namespace csrf {

struct token_handler_test
{
    void
    testToken()
    {
        protector const p;
        token_handler const th;

        test_route_params rp(http::method::get, "/csrf-token");
        BOOST_TEST(invoke(p, rp) == http::route::next);
        auto rv = invoke(th, rp);
        BOOST_TEST(! rv.failed());
        BOOST_TEST(rv != http::route::next);
        BOOST_TEST(rp.ended);
        BOOST_TEST(rp.res.status() == http::status::ok);

        auto const token = rp.issued_token("csrf_token");
        BOOST_TEST_EQ(token.size(), 43u);
        BOOST_TEST_EQ(*find_token(rp.route_data), token);
        BOOST_TEST_EQ(rp.res.value_or(
            http::field::content_length, ""),
                std::to_string(token.size()));
        BOOST_TEST_EQ(rp.res.value_or(
            http::field::content_type, ""),
                "text/plain; charset=utf-8");
    }

    void
    testNoToken()
    {
        token_handler const th;
        test_route_params rp(http::method::get, "/csrf-token");
        auto rv = invoke(th, rp);
        BOOST_TEST(! rv.failed());
        BOOST_TEST(rp.ended);
        BOOST_TEST(rp.res.status() ==
            http::status::internal_server_error);
        BOOST_TEST_EQ(rp.res.value_or(
            http::field::content_length, ""), "8");
    }

    void
    testBound()
    {
        token_handler const th;
        test_route_params rp(http::method::get, "/csrf-token");
        bind_token(rp.route_data, "bound-by-hand");
        invoke(th, rp);
        BOOST_TEST(rp.res.status() == http::status::ok);
        BOOST_TEST_EQ(rp.res.value_or(
            http::field::content_length, ""), "13");
    }

    void
    run()
    {
        testToken();
        testNoToken();
        testBound();
    }
};

} // csrf
} // boost

int
main()
{
    boost::csrf::token_handler_test().run();
    return boost::report_errors();
}
