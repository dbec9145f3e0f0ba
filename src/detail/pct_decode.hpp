//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_SRC_DETAIL_PCT_DECODE_HPP
#define PATHWAY_SRC_DETAIL_PCT_DECODE_HPP

#include <pathway/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <string>

namespace pathway {
namespace detail {

// decode all percent escapes, appending to `dest`
//
// `s` must be a valid percent-encoded string, such
// as a slash-delimited piece of a pct_string_view
void
pct_decode(
    std::string& dest,
    core::string_view s);

} // detail
} // pathway

#endif
