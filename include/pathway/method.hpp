//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_METHOD_HPP
#define PATHWAY_METHOD_HPP

#include <pathway/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <iosfwd>

namespace pathway {

/** HTTP request methods

    Methods outside this set are supported as
    strings by the router and route table.
*/
enum class method : char
{
    unknown = 0,
    delete_,
    get,
    head,
    post,
    put,
    connect,
    options,
    trace,
    patch
};

/** Return the method for a string

    The comparison is case-sensitive, as method
    names are tokens.

    @return The matching method, or
    @ref method::unknown if there is no match.
*/
PATHWAY_DECL
method
string_to_method(
    core::string_view s) noexcept;

/** Return the string for a method

    @return The method token, or `"<unknown>"`.
*/
PATHWAY_DECL
core::string_view
to_string(method v) noexcept;

PATHWAY_DECL
std::ostream&
operator<<(std::ostream&, method);

} // pathway

#endif
