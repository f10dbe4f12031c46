//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/csrf/options.hpp>

#include <boost/csrf/protector.hpp>

#include <boost/core/lightweight_test.hpp>

#include <stdexcept>

namespace boost {
namespace csrf {

struct options_test
{
    void
    testDefaults()
    {
        auto const opts = apply_defaults({});
        BOOST_TEST_EQ(opts.cookie_name, "csrf_token");
        BOOST_TEST_EQ(opts.cookie_path, "/");
        BOOST_TEST_EQ(opts.cookie_domain, "");
        BOOST_TEST(! opts.cookie_secure);
        BOOST_TEST(! opts.cookie_http_only);
        BOOST_TEST(opts.cookie_same_site == same_site::lax);
        BOOST_TEST_EQ(opts.cookie_max_age.count(), 0);
        BOOST_TEST_EQ(opts.header_name, "X-CSRF-Token");
        BOOST_TEST_EQ(opts.form_field, "csrf_token");
        BOOST_TEST(! opts.enforce_origin);
        BOOST_TEST_EQ(opts.allowed_origin, "");
        BOOST_TEST_EQ(opts.token_bytes, 32u);
    }

    void
    testKeepsCallerValues()
    {
        csrf_options in;
        in.cookie_name = "xsrf";
        in.cookie_path = "/app";
        in.cookie_domain = "example.com";
        in.cookie_same_site = same_site::strict;
        in.cookie_max_age = std::chrono::hours(1);
        in.header_name = "X-XSRF-Token";
        in.form_field = "_csrf";
        in.allowed_origin = "app.example.com";
        in.token_bytes = 16;

        auto const opts = apply_defaults(in);
        BOOST_TEST_EQ(opts.cookie_name, "xsrf");
        BOOST_TEST_EQ(opts.cookie_path, "/app");
        BOOST_TEST_EQ(opts.cookie_domain, "example.com");
        BOOST_TEST(opts.cookie_same_site == same_site::strict);
        BOOST_TEST_EQ(opts.cookie_max_age.count(), 3600);
        BOOST_TEST_EQ(opts.header_name, "X-XSRF-Token");
        BOOST_TEST_EQ(opts.form_field, "_csrf");
        BOOST_TEST_EQ(opts.allowed_origin, "app.example.com");
        BOOST_TEST_EQ(opts.token_bytes, 16u);

        // negative Max-Age is kept for make_set_cookie
        in.cookie_max_age = std::chrono::seconds(-5);
        BOOST_TEST_EQ(apply_defaults(in).cookie_max_age.count(), -5);
    }

    void
    testSameSite()
    {
        BOOST_TEST_EQ(to_string(same_site::lax), "Lax");
        BOOST_TEST_EQ(to_string(same_site::strict), "Strict");
        BOOST_TEST_EQ(to_string(same_site::none), "None");
    }

    void
    testValidate()
    {
        // protector holds defaulted options
        {
            protector p;
            BOOST_TEST_EQ(p.options().cookie_name, "csrf_token");
            BOOST_TEST_EQ(p.options().token_bytes, 32u);
        }

        auto bad = [](void(*f)(csrf_options&))
        {
            csrf_options opts;
            f(opts);
            BOOST_TEST_THROWS(protector{opts},
                std::invalid_argument);
        };

        bad([](csrf_options& o){ o.cookie_name = "a b"; });
        bad([](csrf_options& o){ o.cookie_name = "a;b"; });
        bad([](csrf_options& o){ o.cookie_name = "a=b"; });
        bad([](csrf_options& o){ o.cookie_name = "caf\xc3\xa9"; });
        bad([](csrf_options& o){ o.cookie_name = "a\"b"; });
        bad([](csrf_options& o){ o.header_name = "X-CSRF(1)"; });
        bad([](csrf_options& o){ o.header_name = "X CSRF"; });
        bad([](csrf_options& o){ o.header_name = "X:CSRF"; });
        bad([](csrf_options& o){ o.form_field = "a\nb"; });
        bad([](csrf_options& o){ o.cookie_path = "/;x"; });
        bad([](csrf_options& o){ o.cookie_domain = "a\r\nb"; });

        // every tchar is accepted
        {
            csrf_options o;
            o.cookie_name = "a!#$%&'*+-.^_`|~z09";
            o.header_name = "X-Token.v2";
            protector p(o);
            BOOST_TEST_EQ(p.options().cookie_name,
                "a!#$%&'*+-.^_`|~z09");
        }

        csrf_options opts;
        opts.cookie_name = "__Host-csrf";
        opts.form_field = "csrf token[]";
        opts.token_bytes = 8;
        protector p(opts);
        BOOST_TEST_EQ(p.options().cookie_name, "__Host-csrf");
    }

    void
    run()
    {
        testDefaults();
        testKeepsCallerValues();
        testSameSite();
        testValidate();
    }
};

} // csrf
} // boost

int
main()
{
    boost::csrf::options_test().run();
    return boost::report_errors();
}
