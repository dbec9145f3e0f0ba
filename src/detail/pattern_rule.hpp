//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_SRC_DETAIL_PATTERN_RULE_HPP
#define PATHWAY_SRC_DETAIL_PATTERN_RULE_HPP

#include <pathway/detail/config.hpp>
#include <pathway/error.hpp>
#include <pathway/token.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/system/result.hpp>
#include <algorithm>
#include <string>
#include <vector>

namespace pathway {
namespace detail {

/*
pattern          = *( "/" ) [ segment *( 1*"/" segment ) ] *( "/" )
segment          = param / multi-wild / extension / single-wild / literal
param            = ":" name
multi-wild       = "**" [ name ]
extension        = "*." ( ext / "{" ext-list "}" )
single-wild      = "*" [ name ]
literal          = 1*seg-char
name             = 1*seg-char
ext-list         = ext *( "," ext )          ; OWS trimmed around each ext
ext              = 1*( seg-char except "{" "}" "," )
seg-char         = any char except "/"
*/

//------------------------------------------------

constexpr grammar::lut_chars ows_chars(" \t");

constexpr grammar::lut_chars ext_delim_chars("{},");

//------------------------------------------------

/** Rule for the text following "*."

    The value is the list of extensions,
    in the order written.
*/
struct extension_list_rule_t
{
    using value_type =
        std::vector<std::string>;

    auto
    parse(
        char const*& it,
        char const* end) const ->
            system::result<value_type>
    {
        value_type v;
        if(it == end)
            PATHWAY_RETURN_EC(
                error::empty_extension);

        if(*it != '{')
        {
            // single extension
            if(grammar::find_if(
                it, end, ext_delim_chars) != end)
                PATHWAY_RETURN_EC(
                    error::invalid_extension);
            v.emplace_back(it, end);
            it = end;
            return system::result<value_type>(
                std::move(v));
        }

        ++it;
        auto const rb = std::find(it, end, '}');
        if(rb == end)
            PATHWAY_RETURN_EC(
                error::unterminated_brace);
        // nothing may follow the list
        if(rb + 1 != end)
            PATHWAY_RETURN_EC(
                error::invalid_extension);
        if(std::find(it, rb, '{') != rb)
            PATHWAY_RETURN_EC(
                error::invalid_extension);
        if(grammar::find_if_not(
            it, rb, ows_chars) == rb)
            PATHWAY_RETURN_EC(
                error::empty_extension_list);

        for(;;)
        {
            auto const comma = std::find(it, rb, ',');
            auto first = grammar::find_if_not(
                it, comma, ows_chars);
            auto last = comma;
            while( last != first &&
                    ows_chars(last[-1]))
                --last;
            if(first == last)
                PATHWAY_RETURN_EC(
                    error::empty_extension);
            v.emplace_back(first, last);
            if(comma == rb)
                break;
            it = comma + 1;
        }
        it = end;
        return system::result<value_type>(
            std::move(v));
    }
};

constexpr extension_list_rule_t extension_list_rule{};

//------------------------------------------------

/** Rule for one non-empty pattern segment

    The input must not contain a slash. The whole
    input is consumed on success.
*/
struct pattern_segment_rule_t
{
    using value_type = token;

    auto
    parse(
        char const*& it,
        char const* end) const ->
            system::result<value_type>
    {
        if(it == end)
            return grammar::error::need_more;

        if(*it == ':')
        {
            ++it;
            if(it == end)
                PATHWAY_RETURN_EC(
                    error::missing_param_name);
            auto t = token::param(
                core::string_view(it, end - it));
            it = end;
            return t;
        }

        if(*it != '*')
        {
            auto t = token::literal(
                core::string_view(it, end - it));
            it = end;
            return t;
        }

        ++it;
        if(it != end && *it == '*')
        {
            ++it;
            auto t = token::multi_wildcard(
                core::string_view(it, end - it));
            it = end;
            return t;
        }

        if(it != end && *it == '.')
        {
            ++it;
            auto rv = grammar::parse(
                it, end, extension_list_rule);
            if(rv.has_error())
                return rv.error();
            return token::extension(
                std::move(*rv));
        }

        auto t = token::single_wildcard(
            core::string_view(it, end - it));
        it = end;
        return t;
    }
};

constexpr pattern_segment_rule_t pattern_segment_rule{};

} // detail
} // pathway

#endif
