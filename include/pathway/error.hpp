//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_ERROR_HPP
#define PATHWAY_ERROR_HPP

#include <pathway/detail/config.hpp>
#include <boost/system/error_code.hpp>

namespace pathway {

/** Error codes returned by the pattern compiler and parameter accessors
*/
enum class error
{
    /** A `:` marker is not followed by a parameter name.
    */
    missing_param_name = 1,

    /** The same capture name appears twice in one pattern.
    */
    duplicate_param,

    /** An extension pattern names an empty extension.

        This happens for `*.` and for empty alternatives
        such as `*.{jpg,}`.
    */
    empty_extension,

    /** A braced extension list contains no extensions.
    */
    empty_extension_list,

    /** A braced extension list has no closing brace.
    */
    unterminated_brace,

    /** An extension pattern contains misplaced brace
        or separator characters.
    */
    invalid_extension,

    /** A parameter with the requested name was not bound.
    */
    missing_param,

    /** A parameter value is not a decimal integer in range.
    */
    not_an_integer
};

//------------------------------------------------

/** Error conditions corresponding to sets of error codes.
*/
enum class condition
{
    /** The route pattern is malformed.
    */
    invalid_pattern = 1,

    /** A bound parameter is missing or has the wrong form.
    */
    bad_param
};

} // pathway

#include <pathway/impl/error.hpp>

#endif
