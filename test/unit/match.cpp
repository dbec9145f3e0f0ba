//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathway/match.hpp>

#include <boost/core/lightweight_test.hpp>
#include <chrono>
#include <initializer_list>
#include <string>
#include <utility>

namespace pathway {

struct match_test
{
    using binding = std::pair<
        std::string, std::string>;

    static
    param_list
    make_params(
        std::initializer_list<binding> init)
    {
        param_list v;
        for(auto const& b : init)
            v.push_back(b.first, b.second);
        return v;
    }

    // path matches with exactly these bindings
    static
    void
    yes(
        core::string_view pattern,
        core::string_view path,
        std::initializer_list<binding> init = {})
    {
        auto rv = match_pattern(
            compile_pattern(pattern),
            split_path(path));
        if(! BOOST_TEST(rv.has_value()))
        {
            BOOST_LIGHTWEIGHT_TEST_OSTREAM <<
                "  pattern " << pattern <<
                ", path " << path << "\n";
            return;
        }
        BOOST_TEST(*rv == make_params(init));
    }

    static
    void
    no(
        core::string_view pattern,
        core::string_view path)
    {
        auto rv = match_pattern(
            compile_pattern(pattern),
            split_path(path));
        if(! BOOST_TEST(! rv.has_value()))
            BOOST_LIGHTWEIGHT_TEST_OSTREAM <<
                "  pattern " << pattern <<
                ", path " << path << "\n";
    }

    void
    testRoot()
    {
        yes("/", "");
        yes("/", "/");
        yes("", "//");
        no("/", "/x");
        no("/x", "/");
    }

    void
    testLiteral()
    {
        yes("/users", "/users");
        yes("/a/b", "a//b/");
        no("/users", "/Users");
        no("/a/b", "/a");
        no("/a/b", "/a/b/c");
        no("/a", "/b");
    }

    void
    testParam()
    {
        yes("/users/:id", "/users/42", {{ "id", "42" }});
        yes("/users/:id", "/users/42.json", {{ "id", "42.json" }});
        yes("/:a/:b", "/x/y", {{ "a", "x" }, { "b", "y" }});
        no("/users/:id", "/users");
        no("/users/:id", "/users/42/x");
    }

    void
    testSingleWildcard()
    {
        yes("/files/*", "/files/a");
        yes("/files/*name", "/files/a", {{ "name", "a" }});
        yes("/*/b", "/a/b");
        no("/files/*", "/files");
        no("/files/*", "/files/a/b");
    }

    void
    testMultiWildcard()
    {
        yes("/a/**/b", "/a/x/y/b");
        yes("/a/**/b", "/a/b");
        yes("/a/**", "/a");
        yes("/a/**", "/a/x/y/z");
        yes("/**", "/");
        yes("/**", "/x/y");
        no("/a/**/b", "/a/x/y");
        no("/a/**/b", "/b");

        // named captures join with '/'
        yes("/a/**rest", "/a/x/y/z", {{ "rest", "x/y/z" }});
        yes("/a/**rest", "/a", {{ "rest", "" }});
        yes("/a/**mid/b", "/a/x/y/b", {{ "mid", "x/y" }});
        yes("/a/**mid/b", "/a/b", {{ "mid", "" }});

        // two wildcards
        yes("/**x/m/**y", "/a/m/b/m/c",
            {{ "x", "a" }, { "y", "b/m/c" }});
        yes("/**x/**y", "/a/b",
            {{ "x", "" }, { "y", "a/b" }});
    }

    void
    testLazy()
    {
        // shortest capture which lets the rest match
        yes("/a/**x/b", "/a/x/b/y/b", {{ "x", "x/b/y" }});
        yes("/a/**x/b/**y", "/a/x/b/y/b",
            {{ "x", "x" }, { "y", "y/b" }});
        yes("/**pre/*.jpg/**post", "/a.jpg/b.jpg",
            {{ "pre", "" }, { "post", "b.jpg" }});
        yes("/**pre/:file", "/a/b/c",
            {{ "pre", "a/b" }, { "file", "c" }});
        yes("/**pre/:mid/**post", "/a/b/c",
            {{ "pre", "" }, { "mid", "a" }, { "post", "b/c" }});
    }

    void
    testExtension()
    {
        yes("/img/*.{jpg,png}", "/img/photo.png");
        yes("/img/*.{jpg,png}", "/img/photo.jpg");
        yes("/img/*.jpg", "/img/.jpg");
        yes("/*.tar.gz", "/x.tar.gz");
        yes("/files/**/*.jpg", "/files/a/b/c.jpg");
        yes("/files/**dir/*.jpg", "/files/c.jpg", {{ "dir", "" }});
        yes("/files/**dir/*.{jpg,png}", "/files/a/b/photo.jpg",
            {{ "dir", "a/b" }});
        no("/img/*.{jpg,png}", "/img/photo.gif");
        no("/img/*.jpg", "/img/jpg");
        no("/img/*.jpg", "/img/photo.JPG");
        no("/img/*.jpg", "/img/photojpg");
        no("/img/*.jpg", "/img/a.jpg/b");
    }

    void
    testCaseInsensitive()
    {
        auto const p = compile_pattern("/Users/:id/*.JPG");
        auto rv = match_pattern(p,
            split_path("/users/Bob/Face.jpg"), false);
        if(BOOST_TEST(rv.has_value()))
            BOOST_TEST(*rv == make_params(
                {{ "id", "Bob" }}));
        BOOST_TEST(! match_pattern(p,
            split_path("/users/Bob/Face.jpg")));
        BOOST_TEST(! match_pattern(p,
            split_path("/people/Bob/Face.jpg"), false));
    }

    void
    testEmptySegment()
    {
        // caller-supplied segments may be empty
        path_segments const segs = { "users", "" };
        BOOST_TEST(! match_pattern(
            compile_pattern("/users/:id"), segs));
        BOOST_TEST(! match_pattern(
            compile_pattern("/users/*"), segs));
        BOOST_TEST(! match_pattern(
            compile_pattern("/users/*.jpg"), segs));
        BOOST_TEST(! match_pattern(
            compile_pattern("/users/x"), segs, false));

        // but a multi-segment capture spans them
        auto rv = match_pattern(
            compile_pattern("/**rest/b"),
            path_segments{ "a", "", "b" });
        if(BOOST_TEST(rv.has_value()))
            BOOST_TEST_EQ(rv->at("rest"), "a/");
    }

    void
    testLongPath()
    {
        std::size_t const n = 50000;
        path_segments segs(n, "abcdefgh");
        auto const p = compile_pattern("/**rest/z");

        auto const t0 = std::chrono::steady_clock::now();
        BOOST_TEST(! match_pattern(p, segs));
        auto const elapsed =
            std::chrono::steady_clock::now() - t0;
        BOOST_TEST(elapsed < std::chrono::seconds(1));

        segs.emplace_back("z");
        auto rv = match_pattern(p, segs);
        if(BOOST_TEST(rv.has_value()))
            BOOST_TEST_EQ(rv->at("rest").size(), n * 9 - 1);
    }

    void
    run()
    {
        testRoot();
        testLiteral();
        testParam();
        testSingleWildcard();
        testMultiWildcard();
        testLazy();
        testExtension();
        testCaseInsensitive();
        testEmptySegment();
        testLongPath();
    }
};

} // pathway

int
main()
{
    pathway::match_test{}.run();
    return boost::report_errors();
}
