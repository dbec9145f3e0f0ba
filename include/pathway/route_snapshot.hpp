//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_ROUTE_SNAPSHOT_HPP
#define PATHWAY_ROUTE_SNAPSHOT_HPP

#include <pathway/detail/config.hpp>
#include <pathway/route_table.hpp>
#include <boost/smart_ptr/atomic_shared_ptr.hpp>
#include <boost/smart_ptr/make_shared.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>
#include <utility>

namespace pathway {

/** A replaceable reference to the current route table

    Readers call @ref load to obtain the current
    table and keep the returned pointer for the
    duration of a request. A writer may publish a
    new table with @ref store at any time; readers
    holding the previous table continue to use it
    until they release it. Tables are never modified
    in place.

    @par Thread Safety
    All member functions may be called concurrently.

    @par Example
    @code
    route_snapshot< handler > routes( build_routes() );

    // request thread
    auto t = routes.load();
    auto m = t->find( method::get, target );

    // reload thread
    routes.store( build_routes() );
    @endcode
*/
template<
    class Handler,
    class Middleware = Handler>
class route_snapshot
{
public:
    using table_type = route_table<Handler, Middleware>;
    using pointer = boost::shared_ptr<table_type const>;

    /** Constructor

        The snapshot holds an empty table.
    */
    route_snapshot()
        : p_(boost::make_shared<table_type>())
    {
    }

    /** Constructor
    */
    explicit
    route_snapshot(table_type t)
        : p_(boost::make_shared<table_type>(
            std::move(t)))
    {
    }

    route_snapshot(route_snapshot const&) = delete;
    route_snapshot& operator=(route_snapshot const&) = delete;

    /// Return the current table
    pointer
    load() const noexcept
    {
        return p_.load();
    }

    /// Replace the current table
    void
    store(table_type t)
    {
        p_.store(boost::make_shared<
            table_type>(std::move(t)));
    }

    /** Replace the current table

        @return The table which was replaced.
    */
    pointer
    exchange(table_type t)
    {
        return p_.exchange(boost::make_shared<
            table_type>(std::move(t)));
    }

private:
    boost::atomic_shared_ptr<table_type const> p_;
};

} // pathway

#endif
