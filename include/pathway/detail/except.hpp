//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_DETAIL_EXCEPT_HPP
#define PATHWAY_DETAIL_EXCEPT_HPP

#include <pathway/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/error_code.hpp>

namespace pathway {
namespace detail {

PATHWAY_DECL void BOOST_NORETURN throw_invalid_argument(
    char const* what,
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

PATHWAY_DECL void BOOST_NORETURN throw_out_of_range(
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

PATHWAY_DECL void BOOST_NORETURN throw_system_error(
    system::error_code const& ec,
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // pathway

#endif
