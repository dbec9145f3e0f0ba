//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_TOKEN_HPP
#define PATHWAY_TOKEN_HPP

#include <pathway/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <iosfwd>
#include <string>
#include <vector>

namespace pathway {

/** The kind of a compiled pattern token
*/
enum class token_kind : unsigned char
{
    /// Equal to the path segment
    literal,

    /// `:name`, binds one segment
    param,

    /// `*` or `*name`, one segment
    single_wildcard,

    /// `**` or `**name`, zero or more segments
    multi_wildcard,

    /// `*.ext` or `*.{a,b}`, one segment by suffix
    extension
};

/** A unit of matching in a compiled route pattern

    Each token corresponds to exactly one non-empty
    segment of the pattern string. Tokens are plain
    values and compare structurally.
*/
struct token
{
    token_kind kind = token_kind::literal;

    /** The literal text, or the capture name.

        Anonymous wildcards have an empty name.
        Extension tokens leave this empty.
    */
    std::string text;

    /** The accepted extensions, without the dot.

        Only used by @ref token_kind::extension.
    */
    std::vector<std::string> extensions;

    /// Return true if a match of this token is bound to a name
    bool
    binds() const noexcept
    {
        return
            kind != token_kind::literal &&
            kind != token_kind::extension &&
            ! text.empty();
    }

    static
    token
    literal(core::string_view s)
    {
        return token(token_kind::literal, s);
    }

    static
    token
    param(core::string_view name)
    {
        return token(token_kind::param, name);
    }

    static
    token
    single_wildcard(core::string_view name = {})
    {
        return token(token_kind::single_wildcard, name);
    }

    static
    token
    multi_wildcard(core::string_view name = {})
    {
        return token(token_kind::multi_wildcard, name);
    }

    static
    token
    extension(std::vector<std::string> exts)
    {
        token t(token_kind::extension, {});
        t.extensions = std::move(exts);
        return t;
    }

    friend
    bool
    operator==(
        token const& t0,
        token const& t1) noexcept
    {
        return
            t0.kind == t1.kind &&
            t0.text == t1.text &&
            t0.extensions == t1.extensions;
    }

    friend
    bool
    operator!=(
        token const& t0,
        token const& t1) noexcept
    {
        return !(t0 == t1);
    }

    token() = default;

private:
    token(
        token_kind k,
        core::string_view s)
        : kind(k)
        , text(s.data(), s.size())
    {
    }
};

/** Return the pattern syntax for a token

    @par Example
    @code
    assert( to_string( token::param( "id" ) ) == ":id" );
    @endcode
*/
PATHWAY_DECL
std::string
to_string(token const& t);

PATHWAY_DECL
std::ostream&
operator<<(std::ostream&, token const&);

} // pathway

#endif
