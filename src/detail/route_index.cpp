//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/detail/route_index.hpp>
#include "src/detail/match_segment.hpp"
#include <boost/url/grammar/ci_string.hpp>
#include <algorithm>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Each method has its own trie. An edge is either
// a literal segment, looked up by hash, or a dynamic
// token tried in turn after the literal edge. Every
// node records the lowest route number found in its
// subtree, so a search which has already found a
// route can skip subtrees holding only later ones.
//
//  pattern                 path
//  --------------------------------------------------
//  /users/:id          (0) root -users-> n1 -(:id)-> n2*
//  /users/admin        (1)                n1 -admin-> n3*
//  /files/**/*.jpg     (2) root -files-> n4 -(**)-> n5 -(*.jpg)-> n6*
//
// "/users/admin" reaches n3 (route 1) and n2 (route 0);
// route 0 wins because it was registered first.

namespace pathway {
namespace detail {

namespace {

std::string
to_lower(core::string_view s)
{
    std::string r(s.data(), s.size());
    for(auto& c : r)
        c = grammar::to_lower(c);
    return r;
}

} // (anon)

struct route_index::node
{
    std::unordered_map<std::string,
        std::unique_ptr<node>> literals;
    std::vector<std::pair<token,
        std::unique_ptr<node>>> dynamics;

    // route ending here
    std::size_t route = npos;

    // lowest route in this subtree
    std::size_t min_id = npos;
};

struct route_index::impl
{
    std::map<std::string, node> roots;
    std::size_t nodes = 0;
    bool case_sensitive;

    explicit impl(bool cs) noexcept
        : case_sensitive(cs)
    {
    }
};

//------------------------------------------------

// State for one lookup
struct route_index::search
{
    path_segments const& segs;
    bool case_sensitive;
    std::size_t best = npos;
    std::size_t visits = 0;

    // names and ranges bound on the current trie path
    std::vector<bound_range> bound;

    // bindings of the best route so far
    std::vector<bound_range> result;

    search(
        path_segments const& segs_,
        bool cs) noexcept
        : segs(segs_)
        , case_sensitive(cs)
    {
    }

    void
    visit(
        node const& n,
        std::size_t si)
    {
        ++visits;
        if(n.min_id >= best)
            return;

        if( si == segs.size() &&
            n.route < best)
        {
            best = n.route;
            result = bound;
        }

        if( si < segs.size() &&
            ! n.literals.empty())
        {
            auto it = case_sensitive ?
                n.literals.find(segs[si]) :
                n.literals.find(to_lower(segs[si]));
            if(it != n.literals.end())
                visit(*it->second, si + 1);
        }

        for(auto const& e : n.dynamics)
        {
            auto const& t = e.first;
            auto const& child = *e.second;
            if(child.min_id >= best)
                continue;

            if(t.kind == token_kind::multi_wildcard)
            {
                // lazy: shortest capture first
                for(auto last = si;
                    last <= segs.size() &&
                        child.min_id < best;
                    ++last)
                {
                    if(t.binds())
                        bound.push_back({t.text, si, last});
                    visit(child, last);
                    if(t.binds())
                        bound.pop_back();
                }
                continue;
            }

            if(si == segs.size())
                continue;
            if(! match_segment(
                    t, segs[si], case_sensitive))
                continue;
            if(t.binds())
                bound.push_back({t.text, si, si + 1});
            visit(child, si + 1);
            if(t.binds())
                bound.pop_back();
        }
    }
};

//------------------------------------------------

route_index::
~route_index()
{
    delete impl_;
}

route_index::
route_index(bool case_sensitive)
    : impl_(new impl(case_sensitive))
{
}

route_index::
route_index(
    route_index&& other) noexcept
    : impl_(other.impl_)
{
    other.impl_ = nullptr;
}

route_index&
route_index::
operator=(
    route_index&& other) noexcept
{
    delete impl_;
    impl_ = other.impl_;
    other.impl_ = nullptr;
    return *this;
}

bool
route_index::
insert(
    core::string_view verb,
    compiled_pattern const& p,
    std::size_t id)
{
    BOOST_ASSERT(impl_);
    BOOST_ASSERT(id != npos);
    auto const key = std::string(
        verb.data(), verb.size());
    auto it = impl_->roots.find(key);
    if(it == impl_->roots.end())
    {
        it = impl_->roots.emplace(
            key, node{}).first;
        ++impl_->nodes;
    }
    node* n = &it->second;
    n->min_id = (std::min)(n->min_id, id);

    for(auto const& t : p)
    {
        std::unique_ptr<node>* pc;
        if(t.kind == token_kind::literal)
        {
            pc = &n->literals[
                impl_->case_sensitive ?
                    t.text : to_lower(t.text)];
        }
        else
        {
            auto de = std::find_if(
                n->dynamics.begin(),
                n->dynamics.end(),
                [&t](std::pair<token,
                    std::unique_ptr<node>> const& e)
                {
                    return e.first == t;
                });
            if(de == n->dynamics.end())
            {
                n->dynamics.emplace_back(t, nullptr);
                de = std::prev(n->dynamics.end());
            }
            pc = &de->second;
        }
        if(! *pc)
        {
            pc->reset(new node);
            ++impl_->nodes;
        }
        n = pc->get();
        n->min_id = (std::min)(n->min_id, id);
    }

    if(n->route != npos)
    {
        n->route = (std::min)(n->route, id);
        return false;
    }
    n->route = id;
    return true;
}

std::size_t
route_index::
find(
    core::string_view verb,
    path_segments const& segs,
    param_list& params) const
{
    std::size_t visits;
    return find(verb, segs, params, visits);
}

std::size_t
route_index::
find(
    core::string_view verb,
    path_segments const& segs,
    param_list& params,
    std::size_t& visits) const
{
    BOOST_ASSERT(impl_);
    visits = 0;
    auto const it = impl_->roots.find(
        std::string(verb.data(), verb.size()));
    if(it == impl_->roots.end())
        return npos;

    search s(segs, impl_->case_sensitive);
    s.visit(it->second, 0);
    visits = s.visits;
    if(s.best == npos)
        return npos;

    params.clear();
    for(auto const& b : s.result)
        params.push_back(b.name,
            join_segments(segs, b.first, b.last));
    return s.best;
}

std::size_t
route_index::
node_count() const noexcept
{
    if(! impl_)
        return 0;
    return impl_->nodes;
}

} // detail
} // pathway
