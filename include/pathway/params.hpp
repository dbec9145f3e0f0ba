//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_PARAMS_HPP
#define PATHWAY_PARAMS_HPP

#include <pathway/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace pathway {

/** A view of one bound path parameter

    The bound text is also presented split at its
    last dot, so a route such as `/users/:id` can
    serve `/users/42.json` with @ref value equal to
    `"42"` and @ref format equal to `"json"`.
*/
struct path_param
{
    /// The bound text
    core::string_view raw;

    /// The bound text without a trailing `.format`
    core::string_view value;

    /** The text after the last dot

        This is empty when @ref raw has no dot, or
        when the dot is the first or last character.
    */
    core::string_view format;

    /** Return @ref value as a signed decimal integer

        @return The integer, or @ref error::not_an_integer
        if @ref value is not entirely a decimal number
        representable as `std::int64_t`.
    */
    PATHWAY_DECL
    system::result<std::int64_t>
    as_int64() const noexcept;
};

//------------------------------------------------

/** The ordered parameters bound by a route match

    Parameters appear in the order in which their
    tokens appear in the pattern. Anonymous wildcards
    are never present.
*/
class param_list
{
public:
    using value_type =
        std::pair<std::string, std::string>;
    using const_iterator =
        std::vector<value_type>::const_iterator;
    using iterator = const_iterator;
    using size_type = std::size_t;

    param_list() = default;

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

    value_type const&
    operator[](std::size_t i) const noexcept
    {
        return v_[i];
    }

    /** Return the first parameter with the given name

        @return An iterator to the parameter, or
        `end()` if there is none.
    */
    PATHWAY_DECL
    const_iterator
    find(core::string_view name) const noexcept;

    bool
    contains(core::string_view name) const noexcept
    {
        return find(name) != end();
    }

    /** Return the value of the named parameter

        @throws std::out_of_range There is no
        parameter with this name.
    */
    PATHWAY_DECL
    core::string_view
    at(core::string_view name) const;

    /** Return the named parameter as a @ref path_param

        @return The parameter view, or
        @ref error::missing_param.
    */
    PATHWAY_DECL
    system::result<path_param>
    get(core::string_view name) const noexcept;

    /// Append a parameter
    PATHWAY_DECL
    void
    push_back(
        core::string_view name,
        core::string_view value);

    void
    clear() noexcept
    {
        v_.clear();
    }

    friend
    bool
    operator==(
        param_list const& p0,
        param_list const& p1) noexcept
    {
        return p0.v_ == p1.v_;
    }

    friend
    bool
    operator!=(
        param_list const& p0,
        param_list const& p1) noexcept
    {
        return !(p0 == p1);
    }

private:
    std::vector<value_type> v_;
};

} // pathway

#endif
