//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/error.hpp>

namespace pathway {

namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "pathway";
}

std::string
error_cat_type::
message(int code) const
{
    return message(code, nullptr, 0);
}

char const*
error_cat_type::
message(
    int code,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(code))
    {
    case error::missing_param_name: return "missing parameter name";
    case error::duplicate_param: return "duplicate parameter name";
    case error::empty_extension: return "empty extension";
    case error::empty_extension_list: return "empty extension list";
    case error::unterminated_brace: return "unterminated brace";
    case error::invalid_extension: return "invalid extension";
    case error::missing_param: return "missing parameter";
    case error::not_an_integer: return "not an integer";
    default:
        return "unknown";
    }
}

system::error_condition
error_cat_type::
default_error_condition(
    int ev) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::missing_param_name:
    case error::duplicate_param:
    case error::empty_extension:
    case error::empty_extension_list:
    case error::unterminated_brace:
    case error::invalid_extension:
        return condition::invalid_pattern;

    case error::missing_param:
    case error::not_an_integer:
        return condition::bad_param;

    default:
        return {ev, *this};
    }
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "pathway";
}

std::string
condition_cat_type::
message(int code) const
{
    return message(code, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int code,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(code))
    {
    case condition::invalid_pattern: return "invalid route pattern";
    case condition::bad_param: return "bad route parameter";
    default:
        return "unknown";
    }
}

//-----------------------------------------------

// msvc 14.0 has a bug that warns about inability
// to use constexpr construction here, even though
// there's no constexpr construction
#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( push )
# pragma warning( disable : 4592 )
#endif

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail

} // pathway
