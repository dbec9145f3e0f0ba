//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/pattern.hpp>
#include <pathway/error.hpp>
#include "src/detail/pattern_rule.hpp"
#include <algorithm>

namespace pathway {

system::result<compiled_pattern>
parse_pattern(core::string_view s)
{
    compiled_pattern p;
    p.s_.assign(s.data(), s.size());
    auto it = s.data();
    auto const end = it + s.size();
    while(it != end)
    {
        if(*it == '/')
        {
            ++it;
            continue;
        }
        auto const it1 = std::find(it, end, '/');
        auto rv = grammar::parse(
            core::string_view(it, it1 - it),
            detail::pattern_segment_rule);
        if(rv.has_error())
            return rv.error();
        if(rv->binds())
        {
            auto const& name = rv->text;
            for(auto const& t : p.v_)
                if(t.binds() && t.text == name)
                    PATHWAY_RETURN_EC(
                        error::duplicate_param);
        }
        p.v_.push_back(std::move(*rv));
        it = it1;
    }
    // gcc 7 bug workaround
    return system::result<compiled_pattern>(
        std::move(p));
}

compiled_pattern
compile_pattern(core::string_view s)
{
    return parse_pattern(s).value();
}

//------------------------------------------------

bool
compiled_pattern::
is_static() const noexcept
{
    return std::all_of(
        v_.begin(), v_.end(),
        [](token const& t)
        {
            return t.kind == token_kind::literal;
        });
}

std::vector<core::string_view>
compiled_pattern::
param_names() const
{
    std::vector<core::string_view> v;
    for(auto const& t : v_)
        if(t.binds())
            v.emplace_back(t.text);
    return v;
}

} // pathway
