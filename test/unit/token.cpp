//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/csrf/token.hpp>

#include "src/detail/base64.hpp"

#include <boost/core/lightweight_test.hpp>

#include <cstdint>
#include <set>
#include <string>

namespace boost {
namespace csrf {

struct token_test
{
    static
    bool
    is_base64url(core::string_view s)
    {
        for(char c : s)
        {
            if( (c >= 'A' && c <= 'Z') ||
                (c >= 'a' && c <= 'z') ||
                (c >= '0' && c <= '9') ||
                c == '-' || c == '_')
                continue;
            return false;
        }
        return true;
    }

    static
    std::string
    encode(core::string_view s)
    {
        std::string out;
        out.resize(detail::base64url_encoded_size(s.size()));
        auto n = detail::base64url_encode(&out[0],
            reinterpret_cast<std::uint8_t const*>(s.data()),
            s.size());
        BOOST_TEST_EQ(n, out.size());
        return out;
    }

    void
    testEncode()
    {
        // rfc4648 section 10, without padding
        BOOST_TEST_EQ(encode(""), "");
        BOOST_TEST_EQ(encode("f"), "Zg");
        BOOST_TEST_EQ(encode("fo"), "Zm8");
        BOOST_TEST_EQ(encode("foo"), "Zm9v");
        BOOST_TEST_EQ(encode("foob"), "Zm9vYg");
        BOOST_TEST_EQ(encode("fooba"), "Zm9vYmE");
        BOOST_TEST_EQ(encode("foobar"), "Zm9vYmFy");

        // url safe alphabet
        BOOST_TEST_EQ(encode("\xfb\xff"), "-_8");
        BOOST_TEST_EQ(encode("\xff\xff\xff"), "____");
    }

    void
    testMakeToken()
    {
        BOOST_TEST_EQ(make_token(32).size(), 43u);
        BOOST_TEST_EQ(make_token(16).size(), 22u);
        BOOST_TEST_EQ(make_token(12).size(), min_token_size);
        BOOST_TEST_EQ(make_token(1).size(), 2u);
        BOOST_TEST_EQ(make_token(0).size(), 0u);

        std::set<std::string> seen;
        for(int i = 0; i < 64; ++i)
        {
            auto t = make_token(32);
            BOOST_TEST(is_base64url(t));
            BOOST_TEST(t.find('=') == std::string::npos);
            BOOST_TEST(seen.insert(t).second);
        }
    }

    void
    testSecureCompare()
    {
        BOOST_TEST(secure_compare("", ""));
        BOOST_TEST(secure_compare("abc", "abc"));
        BOOST_TEST(! secure_compare("abc", "abd"));
        BOOST_TEST(! secure_compare("abc", "xbc"));
        BOOST_TEST(! secure_compare("abc", "ab"));
        BOOST_TEST(! secure_compare("", "a"));

        auto const t = make_token(32);
        auto u = t;
        u[20] = u[20] == 'A' ? 'B' : 'A';
        BOOST_TEST(secure_compare(t, t));
        BOOST_TEST(! secure_compare(t, u));
        BOOST_TEST(! secure_compare(t, t + "x"));

        // embedded nulls are compared
        BOOST_TEST(! secure_compare(
            core::string_view("a\0b", 3),
            core::string_view("a\0c", 3)));
    }

    void
    run()
    {
        testEncode();
        testMakeToken();
        testSecureCompare();
    }
};

} // csrf
} // boost

int
main()
{
    boost::csrf::token_test().run();
    return boost::report_errors();
}
