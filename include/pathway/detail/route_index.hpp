//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_DETAIL_ROUTE_INDEX_HPP
#define PATHWAY_DETAIL_ROUTE_INDEX_HPP

#include <pathway/detail/config.hpp>
#include <pathway/params.hpp>
#include <pathway/path.hpp>
#include <pathway/pattern.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>

namespace pathway {
namespace detail {

/** A segment trie of compiled patterns, per method

    Routes are identified by the number given when
    they are inserted; a lower number means the route
    was registered earlier. Lookup returns the lowest
    numbered route whose pattern matches, with the
    parameters @ref match_pattern would produce for
    that route.

    The index is not modified by lookups, so
    concurrent calls to @ref find are safe once
    insertion is complete.
*/
class route_index
{
public:
    static constexpr std::size_t npos = std::size_t(-1);

    PATHWAY_DECL
    ~route_index();

    PATHWAY_DECL
    explicit
    route_index(bool case_sensitive);

    PATHWAY_DECL
    route_index(route_index&&) noexcept;

    PATHWAY_DECL
    route_index& operator=(route_index&&) noexcept;

    /** Add a route

        @return `false` if a route with the same method
        and an equal pattern was already inserted. The
        lower numbered of the two always wins, so the
        other one can never be found.
    */
    PATHWAY_DECL
    bool
    insert(
        core::string_view verb,
        compiled_pattern const& p,
        std::size_t id);

    /** Find the first route matching the segments

        @return The route number, or @ref npos. On
        success the parameters are assigned to `params`,
        otherwise `params` is left unchanged.
    */
    PATHWAY_DECL
    std::size_t
    find(
        core::string_view verb,
        path_segments const& segs,
        param_list& params) const;

    /** Find the first route matching the segments

        As above, and `visits` is set to the number
        of trie nodes examined by the search.
    */
    PATHWAY_DECL
    std::size_t
    find(
        core::string_view verb,
        path_segments const& segs,
        param_list& params,
        std::size_t& visits) const;

    /// Return the number of trie nodes, including roots
    PATHWAY_DECL
    std::size_t
    node_count() const noexcept;

private:
    struct node;
    struct impl;
    struct search;

    impl* impl_;
};

} // detail
} // pathway

#endif
