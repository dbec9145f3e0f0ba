//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/params.hpp>
#include <pathway/error.hpp>
#include <pathway/detail/except.hpp>
#include <charconv>

namespace pathway {

system::result<std::int64_t>
path_param::
as_int64() const noexcept
{
    std::int64_t n = 0;
    auto const first = value.data();
    auto const last = first + value.size();
    auto rv = std::from_chars(first, last, n);
    if( value.empty() ||
        rv.ec != std::errc() ||
        rv.ptr != last)
        PATHWAY_RETURN_EC(
            error::not_an_integer);
    return n;
}

//------------------------------------------------

auto
param_list::
find(core::string_view name) const noexcept ->
    const_iterator
{
    auto it = v_.begin();
    for(; it != v_.end(); ++it)
        if(core::string_view(it->first) == name)
            break;
    return it;
}

core::string_view
param_list::
at(core::string_view name) const
{
    auto it = find(name);
    if(it == end())
        detail::throw_out_of_range();
    return it->second;
}

system::result<path_param>
param_list::
get(core::string_view name) const noexcept
{
    auto it = find(name);
    if(it == end())
        PATHWAY_RETURN_EC(
            error::missing_param);
    path_param p;
    p.raw = it->second;
    p.value = p.raw;
    auto const dot = p.raw.rfind('.');
    if( dot != core::string_view::npos &&
        dot > 0 &&
        dot + 1 < p.raw.size())
    {
        p.value = p.raw.substr(0, dot);
        p.format = p.raw.substr(dot + 1);
    }
    return p;
}

void
param_list::
push_back(
    core::string_view name,
    core::string_view value)
{
    v_.emplace_back(
        std::string(name.data(), name.size()),
        std::string(value.data(), value.size()));
}

} // pathway
