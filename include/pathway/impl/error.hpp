//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_IMPL_ERROR_HPP
#define PATHWAY_IMPL_ERROR_HPP

#include <boost/core/detail/string_view.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <boost/system/is_error_condition_enum.hpp>
#include <system_error>

namespace boost {
namespace system {

template<>
struct is_error_code_enum<
    ::pathway::error>
{
    static bool const value = true;
};

template<>
struct is_error_condition_enum<
    ::pathway::condition>
{
    static bool const value = true;
};

} // system
} // boost

namespace std {
template<>
struct is_error_code_enum<
    ::pathway::error>
    : std::true_type {};

template<>
struct is_error_condition_enum<
    ::pathway::condition>
    : std::true_type {};
} // std

namespace pathway {

namespace detail {

struct PATHWAY_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    PATHWAY_DECL const char* name(
        ) const noexcept override;
    PATHWAY_DECL std::string message(
        int) const override;
    PATHWAY_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    PATHWAY_DECL system::error_condition
        default_error_condition(
            int) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x6b2f09e3c4a1d857)
    {
    }
};

struct PATHWAY_SYMBOL_VISIBLE
    condition_cat_type
    : system::error_category
{
    PATHWAY_DECL const char* name(
        ) const noexcept override;
    PATHWAY_DECL std::string message(
        int) const override;
    PATHWAY_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR condition_cat_type()
        : error_category(0x1d4e7a0b93f65c21)
    {
    }
};

PATHWAY_DECL extern
    error_cat_type error_cat;
PATHWAY_DECL extern
    condition_cat_type condition_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

inline
BOOST_SYSTEM_CONSTEXPR
system::error_condition
make_error_condition(
    condition c) noexcept
{
    return system::error_condition{
        static_cast<std::underlying_type<
            condition>::type>(c),
        detail::condition_cat};
}

} // pathway

#endif
