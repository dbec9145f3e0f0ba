//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_PATH_HPP
#define PATHWAY_PATH_HPP

#include <pathway/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/url/pct_string_view.hpp>
#include <string>
#include <vector>

namespace pathway {

/** The non-empty segments of a request path, in order
*/
using path_segments = std::vector<std::string>;

/** Split a request path into segments

    Empty segments are discarded, so leading,
    trailing, and repeated slashes are insignificant.
    The segment text is returned as-is.

    @par Example
    @code
    assert( split_path( "/a//b///" ) == split_path( "a/b" ) );
    @endcode
*/
PATHWAY_DECL
path_segments
split_path(core::string_view path);

/** Split a percent-encoded request path into decoded segments

    The path is split on literal slashes first and
    each segment is decoded afterwards, so an encoded
    slash ("%2F") remains part of its segment.
    Segments which are empty before decoding are
    discarded.
*/
PATHWAY_DECL
path_segments
split_encoded_path(urls::pct_string_view path);

} // pathway

#endif
