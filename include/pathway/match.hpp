//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_MATCH_HPP
#define PATHWAY_MATCH_HPP

#include <pathway/detail/config.hpp>
#include <pathway/params.hpp>
#include <pathway/path.hpp>
#include <pathway/pattern.hpp>
#include <boost/optional/optional.hpp>

namespace pathway {

/** Match path segments against a compiled pattern

    Every token except a multi-segment wildcard
    consumes exactly one segment. A multi-segment
    wildcard is lazy: the rest of the pattern is
    first tried with the wildcard capturing no
    segments, then one, then two, and so on, until
    the rest matches or the segments run out. A
    trailing multi-segment wildcard captures all
    remaining segments. The match succeeds only when
    tokens and segments are exhausted together.

    A named multi-segment capture binds the captured
    segments joined with `/`, which is the empty
    string for a zero-length capture.

    @par Example
    @code
    auto p = compile_pattern( "/files/**dir/*.{jpg,png}" );
    auto rv = match_pattern( p, split_path( "/files/a/b/photo.jpg" ) );
    assert( rv && rv->at( "dir" ) == "a/b" );
    @endcode

    @param p The compiled pattern.

    @param segs The non-empty path segments, as
    produced by @ref split_path.

    @param case_sensitive `false` to compare literal
    and extension text without regard to ASCII case.

    @return The bound parameters in pattern order,
    or an empty optional if the path does not match.
*/
PATHWAY_DECL
boost::optional<param_list>
match_pattern(
    compiled_pattern const& p,
    path_segments const& segs,
    bool case_sensitive = true);

} // pathway

#endif
