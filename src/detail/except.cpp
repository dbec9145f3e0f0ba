//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/detail/except.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>

namespace pathway {
namespace detail {

void
throw_invalid_argument(
    char const* what,
    boost::source_location const& loc)
{
    boost::throw_exception(
        std::invalid_argument(what), loc);
}

void
throw_out_of_range(
    boost::source_location const& loc)
{
    boost::throw_exception(
        std::out_of_range(
            "out of range"), loc);
}

void
throw_system_error(
    system::error_code const& ec,
    boost::source_location const& loc)
{
    boost::throw_exception(
        system::system_error(ec), loc);
}

} // detail
} // pathway
