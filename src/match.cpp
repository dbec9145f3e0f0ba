//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/match.hpp>
#include "src/detail/match_segment.hpp"
#include <utility>

namespace pathway {

namespace {

class matcher
{
    std::vector<token> const& tv_;
    path_segments const& sv_;
    param_list& out_;
    bool cs_;

    // names and segment ranges bound so far
    std::vector<detail::bound_range> bound_;

public:
    matcher(
        compiled_pattern const& p,
        path_segments const& segs,
        param_list& out,
        bool case_sensitive)
        : tv_(p.tokens())
        , sv_(segs)
        , out_(out)
        , cs_(case_sensitive)
    {
    }

    bool
    operator()()
    {
        if(! step(0, 0))
            return false;
        for(auto const& b : bound_)
            out_.push_back(b.name,
                detail::join_segments(
                    sv_, b.first, b.last));
        return true;
    }

private:
    bool
    step(
        std::size_t ti,
        std::size_t si)
    {
        if(ti == tv_.size())
            return si == sv_.size();

        auto const& t = tv_[ti];
        if(t.kind != token_kind::multi_wildcard)
        {
            if(si == sv_.size())
                return false;
            if(! detail::match_segment(
                    t, sv_[si], cs_))
                return false;
            if(t.binds())
                bound_.push_back({t.text, si, si + 1});
            if(step(ti + 1, si + 1))
                return true;
            if(t.binds())
                bound_.pop_back();
            return false;
        }

        if(ti + 1 == tv_.size())
        {
            // trailing, capture the rest
            if(t.binds())
                bound_.push_back(
                    {t.text, si, sv_.size()});
            return true;
        }

        // lazy: shortest capture first
        for(auto last = si; last <= sv_.size(); ++last)
        {
            if(t.binds())
                bound_.push_back({t.text, si, last});
            if(step(ti + 1, last))
                return true;
            if(t.binds())
                bound_.pop_back();
        }
        return false;
    }
};

} // (anon)

boost::optional<param_list>
match_pattern(
    compiled_pattern const& p,
    path_segments const& segs,
    bool case_sensitive)
{
    param_list params;
    if(! matcher(p, segs, params,
            case_sensitive)())
        return boost::none;
    return params;
}

} // pathway
