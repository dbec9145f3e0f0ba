//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_ROUTER_HPP
#define PATHWAY_ROUTER_HPP

#include <pathway/detail/config.hpp>
#include <pathway/detail/except.hpp>
#include <pathway/logger.hpp>
#include <pathway/method.hpp>
#include <pathway/pattern.hpp>
#include <boost/core/detail/string_view.hpp>
#include <string>
#include <utility>
#include <vector>

namespace pathway {

template<class, class> class route_table;

/** Configuration options for routers
*/
class router_options
{
public:
    /** Constructor

        Default options compare literals and
        extensions case-sensitively and do not log.
    */
    router_options() = default;

    /** Set whether pattern matching is case-sensitive.

        This applies to literal segments and
        extensions. Parameter values are always
        bound exactly as they appear in the path.

        @par Example
        @code
        router< handler > r( router_options()
            .case_sensitive( false ) );
        @endcode

        @param value `true` to perform case-sensitive path matching.

        @return A reference to `*this` for chaining.
    */
    router_options&
    case_sensitive(
        bool value) noexcept
    {
        cs_ = value;
        return *this;
    }

    /** Set the log section used for diagnostics

        Registrations are logged at debug level,
        unreachable routes at warning level, table
        construction at info level, and unmatched
        lookups at trace level.

        @return A reference to `*this` for chaining.
    */
    router_options&
    log(section s) noexcept
    {
        log_ = std::move(s);
        return *this;
    }

    /// Return true if matching is case-sensitive
    bool
    case_sensitive() const noexcept
    {
        return cs_;
    }

    /// Return the log section
    section const&
    log() const noexcept
    {
        return log_;
    }

private:
    section log_;
    bool cs_ = true;
};

//------------------------------------------------

/** A registered route

    Entries are created by @ref router and never
    change afterwards.
*/
template<
    class Handler,
    class Middleware = Handler>
struct route_entry
{
    /// The method token this route accepts
    std::string verb;

    /// The compiled path pattern
    compiled_pattern pattern;

    /// The handler
    Handler handler;

    /// Middleware to run before the handler, in order
    std::vector<Middleware> middleware;
};

//------------------------------------------------

/** A builder of routes

    Routes are added in order during startup. The
    router is then moved into a @ref route_table,
    which answers lookups. When more than one route
    matches a request the one added first is chosen,
    whatever the specificity of the others.

    @par Example
    @code
    router< std::string > r;
    r.get( "/users/:id", "show_user" );
    r.get( "/files/**path/*.{jpg,png}", "image" );
    route_table< std::string > t( std::move(r) );

    auto m = t.find( method::get, "/users/42" );
    assert( m && m.handler() == "show_user" );
    assert( m.params().at( "id" ) == "42" );
    @endcode

    @tparam Handler The type of value stored for
    each route.

    @tparam Middleware The type of value stored in
    each route's middleware chain.
*/
template<
    class Handler,
    class Middleware = Handler>
class router
{
public:
    using handler_type = Handler;
    using middleware_type = Middleware;
    using entry_type = route_entry<Handler, Middleware>;

    /** Constructor
    */
    router() = default;

    /** Constructor
    */
    explicit
    router(router_options opt)
        : opt_(std::move(opt))
    {
    }

    /** Add a route for a known method

        @throws std::invalid_argument `verb` is
        @ref method::unknown.

        @throws system::system_error The pattern is
        malformed.
    */
    router&
    add(
        method verb,
        core::string_view pattern,
        Handler h,
        std::vector<Middleware> mw = {})
    {
        if(verb == method::unknown)
            detail::throw_invalid_argument(
                "unknown method");
        return add_impl(to_string(verb), pattern,
            std::move(h), std::move(mw));
    }

    /** Add a route for a method string

        The method is matched by exact equality,
        so any extension method may be used.

        @throws std::invalid_argument `verb` is empty.

        @throws system::system_error The pattern is
        malformed.
    */
    router&
    add(
        core::string_view verb,
        core::string_view pattern,
        Handler h,
        std::vector<Middleware> mw = {})
    {
        if(verb.empty())
            detail::throw_invalid_argument(
                "empty method");
        return add_impl(verb, pattern,
            std::move(h), std::move(mw));
    }

    router&
    get(
        core::string_view pattern,
        Handler h,
        std::vector<Middleware> mw = {})
    {
        return add(method::get, pattern,
            std::move(h), std::move(mw));
    }

    router&
    post(
        core::string_view pattern,
        Handler h,
        std::vector<Middleware> mw = {})
    {
        return add(method::post, pattern,
            std::move(h), std::move(mw));
    }

    router&
    put(
        core::string_view pattern,
        Handler h,
        std::vector<Middleware> mw = {})
    {
        return add(method::put, pattern,
            std::move(h), std::move(mw));
    }

    router&
    patch(
        core::string_view pattern,
        Handler h,
        std::vector<Middleware> mw = {})
    {
        return add(method::patch, pattern,
            std::move(h), std::move(mw));
    }

    router&
    delete_(
        core::string_view pattern,
        Handler h,
        std::vector<Middleware> mw = {})
    {
        return add(method::delete_, pattern,
            std::move(h), std::move(mw));
    }

    router&
    head(
        core::string_view pattern,
        Handler h,
        std::vector<Middleware> mw = {})
    {
        return add(method::head, pattern,
            std::move(h), std::move(mw));
    }

    router&
    options(
        core::string_view pattern,
        Handler h,
        std::vector<Middleware> mw = {})
    {
        return add(method::options, pattern,
            std::move(h), std::move(mw));
    }

    /// Return the number of routes
    std::size_t
    size() const noexcept
    {
        return v_.size();
    }

    /// Return the routes in registration order
    std::vector<entry_type> const&
    entries() const noexcept
    {
        return v_;
    }

    /// Return the options
    router_options const&
    get_options() const noexcept
    {
        return opt_;
    }

private:
    template<class, class>
    friend class route_table;

    router&
    add_impl(
        core::string_view verb,
        core::string_view pattern,
        Handler&& h,
        std::vector<Middleware>&& mw)
    {
        auto rv = parse_pattern(pattern);
        if(rv.has_error())
        {
            LOG_ERR(opt_.log())(
                "bad pattern \"{}\": {}",
                pattern, rv.error().message());
            detail::throw_system_error(rv.error());
        }
        LOG_DBG(opt_.log())(
            "route #{} {} {}",
            v_.size(), verb, pattern);
        v_.push_back(entry_type{
            std::string(verb.data(), verb.size()),
            std::move(*rv),
            std::move(h),
            std::move(mw)});
        return *this;
    }

    router_options opt_;
    std::vector<entry_type> v_;
};

} // pathway

#endif
