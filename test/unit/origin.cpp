//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/csrf/origin.hpp>

#include <boost/http/field.hpp>
#include <boost/http/request.hpp>
#include <boost/core/lightweight_test.hpp>

namespace boost {
namespace csrf {

struct origin_test
{
    static
    bool
    ok(
        core::string_view origin,
        core::string_view referer,
        core::string_view host,
        core::string_view allowed = "")
    {
        return ! check_origin(
            origin, referer, host, allowed).failed();
    }

    static
    system::error_code
    check(
        core::string_view origin,
        core::string_view referer,
        core::string_view host,
        core::string_view allowed = "")
    {
        return check_origin(
            origin, referer, host, allowed);
    }

    void
    testOrigin()
    {
        BOOST_TEST(ok("https://example.com", "", "example.com"));
        BOOST_TEST(ok("http://example.com", "", "example.com"));
        BOOST_TEST(ok("https://EXAMPLE.com", "", "example.COM"));
        BOOST_TEST(ok("http://localhost:8080", "", "localhost:8080"));

        BOOST_TEST(check("https://evil.com", "", "example.com") ==
            error::bad_origin);
        // port is part of the comparison
        BOOST_TEST(check("http://localhost:8081", "", "localhost:8080") ==
            error::bad_origin);
        BOOST_TEST(check("http://localhost", "", "localhost:8080") ==
            error::bad_origin);
        // subdomains do not match
        BOOST_TEST(check("https://app.example.com", "", "example.com") ==
            error::bad_origin);
        BOOST_TEST(check("https://example.com.evil.com", "", "example.com") ==
            error::bad_origin);
        // opaque origin
        BOOST_TEST(check("null", "", "example.com") ==
            error::bad_origin);
        // unparseable
        BOOST_TEST(check("http://exa mple.com", "", "example.com") ==
            error::bad_origin);

        // Origin takes precedence over Referer
        BOOST_TEST(check("https://evil.com",
            "https://example.com/form", "example.com") ==
                error::bad_origin);
        BOOST_TEST(ok("https://example.com",
            "https://evil.com/form", "example.com"));
    }

    void
    testReferer()
    {
        BOOST_TEST(ok("", "https://example.com/form?x=1", "example.com"));
        BOOST_TEST(ok("", "https://user@example.com/", "example.com"));
        BOOST_TEST(check("", "https://evil.com/form", "example.com") ==
            error::bad_referer);
        BOOST_TEST(check("", "/relative/path", "example.com") ==
            error::bad_referer);
    }

    void
    testMissing()
    {
        auto ec = check("", "", "example.com");
        BOOST_TEST(ec == error::no_origin);
        BOOST_TEST(ec == condition::invalid_origin);

        // an empty host never matches
        BOOST_TEST(check("https://example.com", "", "") ==
            error::bad_origin);
    }

    void
    testAllowed()
    {
        BOOST_TEST(ok("https://app.example.com", "",
            "internal:8080", "app.example.com"));
        BOOST_TEST(check("https://internal:8080", "",
            "internal:8080", "app.example.com") ==
                error::bad_origin);
        BOOST_TEST(ok("", "https://app.example.com/x", "",
            "app.example.com"));
    }

    void
    testRequest()
    {
        {
            http::request req;
            req.set(http::field::host, "example.com");
            req.set(http::field::origin, "https://example.com");
            BOOST_TEST(! check_origin(req, "").failed());
        }
        {
            http::request req;
            req.set(http::field::host, "example.com");
            req.set(http::field::referer, "https://evil.com/");
            BOOST_TEST(check_origin(req, "") == error::bad_referer);
        }
        {
            http::request req;
            req.set(http::field::host, "example.com");
            BOOST_TEST(check_origin(req, "") == error::no_origin);
        }
    }

    void
    run()
    {
        testOrigin();
        testReferer();
        testMissing();
        testAllowed();
        testRequest();
    }
};

} // csrf
} // boost

int
main()
{
    boost::csrf::origin_test().run();
    return boost::report_errors();
}
