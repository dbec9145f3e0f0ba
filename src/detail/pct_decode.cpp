//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/pct_decode.hpp"
#include <boost/url/grammar/hexdig_chars.hpp>
#include <boost/assert.hpp>

namespace pathway {
namespace detail {

void
pct_decode(
    std::string& dest,
    core::string_view s)
{
    dest.reserve(dest.size() + s.size());
    auto it = s.data();
    auto const end = it + s.size();
    for(;;)
    {
        if(it == end)
            break;
        if(*it != '%')
        {
            dest.push_back(*it++);
            continue;
        }
        ++it;
        BOOST_ASSERT(end - it >= 2);
        auto d0 = grammar::hexdig_value(*it++);
        auto d1 = grammar::hexdig_value(*it++);
        BOOST_ASSERT(d0 >= 0 && d1 >= 0);
        dest.push_back(static_cast<char>(
            d0 * 16 + d1));
    }
}

} // detail
} // pathway
