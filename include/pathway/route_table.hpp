//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_ROUTE_TABLE_HPP
#define PATHWAY_ROUTE_TABLE_HPP

#include <pathway/detail/config.hpp>
#include <pathway/detail/except.hpp>
#include <pathway/detail/route_index.hpp>
#include <pathway/logger.hpp>
#include <pathway/method.hpp>
#include <pathway/params.hpp>
#include <pathway/path.hpp>
#include <pathway/router.hpp>
#include <boost/url/url_view_base.hpp>
#include <boost/assert.hpp>
#include <memory>
#include <utility>
#include <vector>

namespace pathway {

#ifdef BOOST_MSVC
#pragma warning(push)
#pragma warning(disable: 4251) // shared_ptr needs dll-interface
#endif

/** The result of a route lookup

    An empty result means no route matched. A
    non-empty result refers to the matched route and
    holds the parameters bound by its pattern. The
    route remains valid for as long as the result
    exists, even if the table it came from is
    destroyed.
*/
template<
    class Handler,
    class Middleware = Handler>
class route_match
{
public:
    using entry_type = route_entry<Handler, Middleware>;

    /** Constructor

        The default constructed result is empty.
    */
    route_match() = default;

    route_match(
        std::shared_ptr<entry_type const> e,
        param_list params) noexcept
        : e_(std::move(e))
        , params_(std::move(params))
    {
    }

    /// Return true if a route matched
    explicit
    operator bool() const noexcept
    {
        return e_ != nullptr;
    }

    /** Return the matched route

        @par Preconditions
        `static_cast<bool>(*this)`
    */
    entry_type const&
    route() const noexcept
    {
        BOOST_ASSERT(e_);
        return *e_;
    }

    Handler const&
    handler() const noexcept
    {
        return route().handler;
    }

    std::vector<Middleware> const&
    middleware() const noexcept
    {
        return route().middleware;
    }

    /// Return the bound parameters, in pattern order
    param_list const&
    params() const noexcept
    {
        return params_;
    }

private:
    std::shared_ptr<entry_type const> e_;
    param_list params_;
};

//------------------------------------------------

/** An immutable table of routes

    A table is built once from a @ref router and is
    never modified afterwards. Copies share the same
    routes, and lookups may be performed concurrently
    from any number of threads without
    synchronization.

    Routes are filtered by exact equality of the
    method token, then the first route in
    registration order whose pattern matches the
    path is chosen. A later route never overrides
    an earlier one, even when its pattern is more
    specific.
*/
template<
    class Handler,
    class Middleware = Handler>
class route_table
{
public:
    using router_type = router<Handler, Middleware>;
    using entry_type = route_entry<Handler, Middleware>;
    using match_type = route_match<Handler, Middleware>;

    /** Constructor

        The table is empty.
    */
    route_table()
        : route_table(router_type())
    {
    }

    /** Constructor

        The routes are moved out of the router.
        A route whose method and pattern are equal
        to those of an earlier route can never be
        chosen; a warning is logged for each one.
    */
    explicit
    route_table(router_type&& r)
        : impl_(build(std::move(r)))
    {
    }

    /** Find the route for a known method and raw path

        The path is split on `/` with empty segments
        discarded. Segments are not percent-decoded.

        @throws std::invalid_argument `verb` is
        @ref method::unknown.
    */
    match_type
    find(
        method verb,
        core::string_view path) const
    {
        if(verb == method::unknown)
            detail::throw_invalid_argument(
                "unknown method");
        return find_impl(to_string(verb),
            split_path(path), path);
    }

    /** Find the route for a method string and raw path

        @throws std::invalid_argument `verb` is empty.
    */
    match_type
    find(
        core::string_view verb,
        core::string_view path) const
    {
        if(verb.empty())
            detail::throw_invalid_argument(
                "empty method");
        return find_impl(verb,
            split_path(path), path);
    }

    /** Find the route for a known method and URL

        The encoded path of the URL is split on `/`
        first, then each segment is percent-decoded,
        so an encoded slash stays within its segment.

        @throws std::invalid_argument `verb` is
        @ref method::unknown.
    */
    match_type
    find(
        method verb,
        urls::url_view_base const& url) const
    {
        if(verb == method::unknown)
            detail::throw_invalid_argument(
                "unknown method");
        auto const ep = url.encoded_path();
        core::string_view path(ep);
        return find_impl(to_string(verb),
            split_encoded_path(ep), path);
    }

    /** Find the route for a method string and URL

        @throws std::invalid_argument `verb` is empty.
    */
    match_type
    find(
        core::string_view verb,
        urls::url_view_base const& url) const
    {
        if(verb.empty())
            detail::throw_invalid_argument(
                "empty method");
        auto const ep = url.encoded_path();
        core::string_view path(ep);
        return find_impl(verb,
            split_encoded_path(ep), path);
    }

    /** Find the route for already split segments

        The segments must be non-empty, as produced
        by @ref split_path or @ref split_encoded_path.
    */
    match_type
    find_segments(
        core::string_view verb,
        path_segments const& segs) const
    {
        return find_impl(verb, segs, {});
    }

    /// Return the number of routes
    std::size_t
    size() const noexcept
    {
        return impl_->entries.size();
    }

    /// Return the routes in registration order
    std::vector<entry_type> const&
    entries() const noexcept
    {
        return impl_->entries;
    }

private:
    struct impl
    {
        std::vector<entry_type> entries;
        detail::route_index index;
        section log;

        explicit
        impl(router_options const& opt)
            : index(opt.case_sensitive())
            , log(opt.log())
        {
        }
    };

    static
    std::shared_ptr<impl const>
    build(router_type&& r)
    {
        auto p = std::make_shared<impl>(r.opt_);
        p->entries = std::move(r.v_);
        for(std::size_t i = 0;
            i < p->entries.size(); ++i)
        {
            auto const& e = p->entries[i];
            if(! p->index.insert(
                    e.verb, e.pattern, i))
                LOG_WRN(p->log)(
                    "route #{} {} {} is unreachable",
                    i, e.verb, e.pattern.str());
        }
        LOG_INF(p->log)(
            "built {} routes, {} nodes",
            p->entries.size(),
            p->index.node_count());
        return p;
    }

    match_type
    find_impl(
        core::string_view verb,
        path_segments const& segs,
        core::string_view path) const
    {
        param_list params;
        auto const i = impl_->index.find(
            verb, segs, params);
        if(i == detail::route_index::npos)
        {
            LOG_TRC(impl_->log)(
                "no route for {} {}", verb, path);
            return {};
        }
        return match_type(
            std::shared_ptr<entry_type const>(
                impl_, &impl_->entries[i]),
            std::move(params));
    }

    std::shared_ptr<impl const> impl_;
};

#ifdef BOOST_MSVC
#pragma warning(pop)
#endif

} // pathway

#endif
