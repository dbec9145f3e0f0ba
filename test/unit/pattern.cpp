//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathway/pattern.hpp>

#include <pathway/error.hpp>
#include <boost/core/lightweight_test.hpp>
#include <boost/system/system_error.hpp>

namespace pathway {

struct pattern_test
{
    static
    void
    check(
        core::string_view s,
        std::vector<token> const& v)
    {
        auto rv = parse_pattern(s);
        if(! BOOST_TEST(rv.has_value()))
            return;
        BOOST_TEST(rv->tokens() == v);
        BOOST_TEST_EQ(rv->str(), s);
    }

    static
    void
    bad(
        core::string_view s,
        error e)
    {
        auto rv = parse_pattern(s);
        if(! BOOST_TEST(rv.has_error()))
            return;
        BOOST_TEST(rv.error() == e);
        BOOST_TEST(rv.error() ==
            condition::invalid_pattern);
    }

    void
    testRoot()
    {
        check("", {});
        check("/", {});
        check("///", {});
        BOOST_TEST(compile_pattern("/").empty());
        BOOST_TEST(compile_pattern("").is_static());
    }

    void
    testLiteral()
    {
        check("/users", {
            token::literal("users") });
        check("/a//b/", {
            token::literal("a"),
            token::literal("b") });
        check("a/b", {
            token::literal("a"),
            token::literal("b") });
        // markers only count at the start of a segment
        check("/a:b/c*/d.e", {
            token::literal("a:b"),
            token::literal("c*"),
            token::literal("d.e") });
        BOOST_TEST(compile_pattern("/a/b").is_static());
    }

    void
    testParam()
    {
        check("/users/:id", {
            token::literal("users"),
            token::param("id") });
        check("/:a/:b", {
            token::param("a"),
            token::param("b") });
        BOOST_TEST(! compile_pattern("/:id").is_static());
    }

    void
    testWildcards()
    {
        check("/files/*", {
            token::literal("files"),
            token::single_wildcard() });
        check("/files/*name", {
            token::literal("files"),
            token::single_wildcard("name") });
        check("/a/**/b", {
            token::literal("a"),
            token::multi_wildcard(),
            token::literal("b") });
        check("/a/**rest", {
            token::literal("a"),
            token::multi_wildcard("rest") });
        // "**" is tested before "*."
        check("/**.jpg", {
            token::multi_wildcard(".jpg") });
    }

    void
    testExtension()
    {
        check("/img/*.jpg", {
            token::literal("img"),
            token::extension({ "jpg" }) });
        check("/img/*.{jpg,png}", {
            token::literal("img"),
            token::extension({ "jpg", "png" }) });
        check("/img/*.{ jpg , png,gif }", {
            token::literal("img"),
            token::extension({ "jpg", "png", "gif" }) });
        check("/*.tar.gz", {
            token::extension({ "tar.gz" }) });
    }

    void
    testMalformed()
    {
        bad("/:", error::missing_param_name);
        bad("/users/:/x", error::missing_param_name);
        bad("/:id/:id", error::duplicate_param);
        bad("/*x/**x", error::duplicate_param);
        bad("/:name/*name", error::duplicate_param);
        bad("/*.", error::empty_extension);
        bad("/*.{jpg,}", error::empty_extension);
        bad("/*.{,jpg}", error::empty_extension);
        bad("/*.{jpg,,png}", error::empty_extension);
        bad("/*.{}", error::empty_extension_list);
        bad("/*.{  }", error::empty_extension_list);
        bad("/*.{jpg", error::unterminated_brace);
        bad("/*.{jpg,png", error::unterminated_brace);
        bad("/*.{jpg}x", error::invalid_extension);
        bad("/*.{a{b}", error::invalid_extension);
        bad("/*.jpg,png", error::invalid_extension);
        bad("/*.jp}g", error::invalid_extension);

        // anonymous wildcards never collide
        BOOST_TEST(parse_pattern("/*/*/**/**").has_value());

        BOOST_TEST_THROWS(
            compile_pattern("/:"),
            system::system_error);
        BOOST_TEST_THROWS(
            compile_pattern("/*.{}"),
            system::system_error);
    }

    void
    testTransparency()
    {
        char const* const v[] = {
            "/",
            "/users/:id",
            "/files/**path/*.{jpg,png}",
            "/a/*/b/*name/**",
            };
        for(auto s : v)
        {
            auto p0 = compile_pattern(s);
            auto p1 = compile_pattern(s);
            BOOST_TEST(p0 == p1);
            BOOST_TEST(p0.tokens() == p1.tokens());
        }
        BOOST_TEST(
            compile_pattern("/a//b/") ==
            compile_pattern("a/b"));
        BOOST_TEST(
            compile_pattern("/a/:x") !=
            compile_pattern("/a/:y"));
    }

    void
    testParamNames()
    {
        auto p = compile_pattern(
            "/:org/*/repos/*repo/**path/*.{c,h}");
        auto v = p.param_names();
        if(BOOST_TEST_EQ(v.size(), 3u))
        {
            BOOST_TEST_EQ(v[0], "org");
            BOOST_TEST_EQ(v[1], "repo");
            BOOST_TEST_EQ(v[2], "path");
        }
        BOOST_TEST(compile_pattern(
            "/a/*/**").param_names().empty());
    }

    void
    run()
    {
        testRoot();
        testLiteral();
        testParam();
        testWildcards();
        testExtension();
        testMalformed();
        testTransparency();
        testParamNames();
    }
};

} // pathway

int
main()
{
    pathway::pattern_test{}.run();
    return boost::report_errors();
}
