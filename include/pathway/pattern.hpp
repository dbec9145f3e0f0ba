//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_PATTERN_HPP
#define PATHWAY_PATTERN_HPP

#include <pathway/detail/config.hpp>
#include <pathway/token.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>
#include <vector>

namespace pathway {

class compiled_pattern;

/** Parse a route pattern

    The pattern is split on `/` and empty segments
    are discarded, so leading, trailing, and repeated
    slashes are insignificant. Each remaining segment
    becomes one @ref token:

    @code
    segment          literal, exact match
    :name            named single-segment capture
    *                anonymous single-segment wildcard
    *name            named single-segment wildcard
    **               anonymous multi-segment capture
    **name           named multi-segment capture
    *.ext            segment ending in ".ext"
    *.{ext1,ext2}    segment ending in any listed extension
    @endcode

    The markers are tested in the order shown,
    first match wins.

    @return The compiled pattern, or an error from
    the @ref error enumeration when the pattern is
    malformed. All such errors compare equal to
    @ref condition::invalid_pattern.
*/
PATHWAY_DECL
system::result<compiled_pattern>
parse_pattern(core::string_view s);

/** Compile a route pattern

    This is the registration entry point. It behaves
    like @ref parse_pattern but reports failures by
    throwing.

    @throws system::system_error The pattern is malformed.
*/
PATHWAY_DECL
compiled_pattern
compile_pattern(core::string_view s);

//------------------------------------------------

/** A route pattern compiled to a sequence of tokens

    Objects of this type are produced by
    @ref parse_pattern and @ref compile_pattern and
    are immutable afterwards. Equality compares the
    token sequences only, so `"/a//b/"` and `"a/b"`
    compile to equal patterns.
*/
class compiled_pattern
{
public:
    using value_type = token;
    using const_iterator =
        std::vector<token>::const_iterator;
    using iterator = const_iterator;
    using size_type = std::size_t;

    /** Constructor

        A default constructed pattern has no tokens,
        which is the same as the pattern `"/"`.
    */
    compiled_pattern() = default;

    /// Return the pattern string this was compiled from
    core::string_view
    str() const noexcept
    {
        return s_;
    }

    /// Return the tokens
    std::vector<token> const&
    tokens() const noexcept
    {
        return v_;
    }

    std::size_t
    size() const noexcept
    {
        return v_.size();
    }

    bool
    empty() const noexcept
    {
        return v_.empty();
    }

    const_iterator
    begin() const noexcept
    {
        return v_.begin();
    }

    const_iterator
    end() const noexcept
    {
        return v_.end();
    }

    token const&
    operator[](std::size_t i) const noexcept
    {
        return v_[i];
    }

    /** Return true if every token is a literal
    */
    PATHWAY_DECL
    bool
    is_static() const noexcept;

    /** Return the names bound by a successful match

        The names appear in pattern order, which is
        also the order of the resulting parameters.
    */
    PATHWAY_DECL
    std::vector<core::string_view>
    param_names() const;

    friend
    bool
    operator==(
        compiled_pattern const& p0,
        compiled_pattern const& p1) noexcept
    {
        return p0.v_ == p1.v_;
    }

    friend
    bool
    operator!=(
        compiled_pattern const& p0,
        compiled_pattern const& p1) noexcept
    {
        return !(p0 == p1);
    }

private:
    friend PATHWAY_DECL
        system::result<compiled_pattern>
        parse_pattern(core::string_view);

    std::string s_;
    std::vector<token> v_;
};

} // pathway

#endif
