//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/path.hpp>
#include "src/detail/pct_decode.hpp"
#include <algorithm>

namespace pathway {

path_segments
split_path(core::string_view path)
{
    path_segments v;
    auto it = path.data();
    auto const end = it + path.size();
    while(it != end)
    {
        if(*it == '/')
        {
            ++it;
            continue;
        }
        auto const it1 = std::find(it, end, '/');
        v.emplace_back(it, it1);
        it = it1;
    }
    return v;
}

path_segments
split_encoded_path(urls::pct_string_view path)
{
    path_segments v;
    core::string_view sv(path);
    auto it = sv.data();
    auto const end = it + sv.size();
    while(it != end)
    {
        if(*it == '/')
        {
            ++it;
            continue;
        }
        auto const it1 = std::find(it, end, '/');
        v.emplace_back();
        detail::pct_decode(v.back(),
            core::string_view(it, it1 - it));
        it = it1;
    }
    return v;
}

} // pathway
