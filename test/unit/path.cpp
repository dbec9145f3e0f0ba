//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathway/path.hpp>

#include <boost/core/lightweight_test.hpp>

namespace pathway {

struct path_test
{
    void
    testSplit()
    {
        path_segments const ab = { "a", "b" };
        BOOST_TEST(split_path("/a//b///") == ab);
        BOOST_TEST(split_path("/a/b") == ab);
        BOOST_TEST(split_path("a/b") == ab);
        BOOST_TEST(split_path("").empty());
        BOOST_TEST(split_path("/").empty());
        BOOST_TEST(split_path("////").empty());

        auto v = split_path("/x/%2F/y.jpg");
        if(BOOST_TEST_EQ(v.size(), 3u))
        {
            BOOST_TEST_EQ(v[0], "x");
            // not decoded
            BOOST_TEST_EQ(v[1], "%2F");
            BOOST_TEST_EQ(v[2], "y.jpg");
        }
    }

    void
    testSplitEncoded()
    {
        path_segments const ab = { "a", "b" };
        BOOST_TEST(split_encoded_path("/a//b/") == ab);
        BOOST_TEST(split_encoded_path("").empty());

        auto v = split_encoded_path(
            "/files/a%2Fb/hello%20world.txt");
        if(BOOST_TEST_EQ(v.size(), 3u))
        {
            BOOST_TEST_EQ(v[0], "files");
            // decoded after splitting
            BOOST_TEST_EQ(v[1], "a/b");
            BOOST_TEST_EQ(v[2], "hello world.txt");
        }

        v = split_encoded_path("/%41%62c");
        if(BOOST_TEST_EQ(v.size(), 1u))
            BOOST_TEST_EQ(v[0], "Abc");
    }

    void
    run()
    {
        testSplit();
        testSplitEncoded();
    }
};

} // pathway

int
main()
{
    pathway::path_test{}.run();
    return boost::report_errors();
}
