//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_SRC_DETAIL_MATCH_SEGMENT_HPP
#define PATHWAY_SRC_DETAIL_MATCH_SEGMENT_HPP

#include <pathway/detail/config.hpp>
#include <pathway/path.hpp>
#include <pathway/token.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <boost/assert.hpp>
#include <string>

namespace pathway {
namespace detail {

inline
bool
text_equal(
    core::string_view s0,
    core::string_view s1,
    bool case_sensitive) noexcept
{
    if(case_sensitive)
        return s0 == s1;
    return grammar::ci_is_equal(s0, s1);
}

// true if `seg` ends in "." followed by `ext`
inline
bool
has_extension(
    core::string_view seg,
    core::string_view ext,
    bool case_sensitive) noexcept
{
    if(seg.size() <= ext.size())
        return false;
    auto const dot = seg.size() - ext.size() - 1;
    if(seg[dot] != '.')
        return false;
    return text_equal(
        seg.substr(dot + 1), ext, case_sensitive);
}

// Matches one segment against a single-segment token
inline
bool
match_segment(
    token const& t,
    core::string_view seg,
    bool case_sensitive) noexcept
{
    // an empty segment never matches
    if(seg.empty())
        return false;
    switch(t.kind)
    {
    case token_kind::literal:
        return text_equal(
            t.text, seg, case_sensitive);

    case token_kind::param:
    case token_kind::single_wildcard:
        return true;

    case token_kind::extension:
        for(auto const& ext : t.extensions)
            if(has_extension(
                    seg, ext, case_sensitive))
                return true;
        return false;

    case token_kind::multi_wildcard:
        break;
    }
    // multi_wildcard spans segments
    BOOST_ASSERT(false);
    return false;
}

// A name bound to segments [first, last)
struct bound_range
{
    core::string_view name;
    std::size_t first;
    std::size_t last;
};

// Joins segments [first, last) with '/'
inline
std::string
join_segments(
    path_segments const& v,
    std::size_t first,
    std::size_t last)
{
    std::string s;
    for(auto i = first; i < last; ++i)
    {
        if(i > first)
            s.push_back('/');
        s.append(v[i]);
    }
    return s;
}

} // detail
} // pathway

#endif
