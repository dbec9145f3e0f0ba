//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathway/token.hpp>

#include <boost/core/lightweight_test.hpp>
#include <sstream>

namespace pathway {

struct token_test
{
    void
    testBinds()
    {
        BOOST_TEST(! token::literal("a").binds());
        BOOST_TEST(token::param("id").binds());
        BOOST_TEST(! token::single_wildcard().binds());
        BOOST_TEST(token::single_wildcard("x").binds());
        BOOST_TEST(! token::multi_wildcard().binds());
        BOOST_TEST(token::multi_wildcard("rest").binds());
        BOOST_TEST(! token::extension({ "jpg" }).binds());
    }

    void
    testEquality()
    {
        BOOST_TEST(token::param("id") == token::param("id"));
        BOOST_TEST(token::param("id") != token::param("ID"));
        BOOST_TEST(token::param("id") !=
            token::single_wildcard("id"));
        BOOST_TEST(token::literal("x") !=
            token::param("x"));
        BOOST_TEST(token::extension({ "a", "b" }) ==
            token::extension({ "a", "b" }));
        BOOST_TEST(token::extension({ "a", "b" }) !=
            token::extension({ "b", "a" }));
        BOOST_TEST(token() == token::literal(""));
    }

    void
    testToString()
    {
        BOOST_TEST_EQ(to_string(token::literal("users")), "users");
        BOOST_TEST_EQ(to_string(token::param("id")), ":id");
        BOOST_TEST_EQ(to_string(token::single_wildcard()), "*");
        BOOST_TEST_EQ(to_string(token::single_wildcard("n")), "*n");
        BOOST_TEST_EQ(to_string(token::multi_wildcard()), "**");
        BOOST_TEST_EQ(to_string(token::multi_wildcard("rest")), "**rest");
        BOOST_TEST_EQ(to_string(token::extension({ "jpg" })), "*.jpg");
        BOOST_TEST_EQ(to_string(
            token::extension({ "jpg", "png" })), "*.{jpg,png}");

        std::stringstream ss;
        ss << token::param("id") << '/' << token::multi_wildcard();
        BOOST_TEST_EQ(ss.str(), ":id/**");
    }

    void
    run()
    {
        testBinds();
        testEquality();
        testToString();
    }
};

} // pathway

int
main()
{
    pathway::token_test{}.run();
    return boost::report_errors();
}
