//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Measures the cost of finding the last of N literal routes,
// comparing the route table to a linear scan with match_pattern.

#include <pathway.hpp>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

namespace {

using clock_type = std::chrono::steady_clock;

std::string
route_path(std::size_t i)
{
    return "/api/v1/resource" + std::to_string(i) + "/items";
}

double
ns_per_op(
    clock_type::duration d,
    std::size_t ops)
{
    return std::chrono::duration<double, std::nano>(
        d).count() / static_cast<double>(ops);
}

void
bench(
    std::size_t n,
    std::size_t iterations)
{
    pathway::router<std::size_t> r;
    std::vector<pathway::compiled_pattern> linear;
    for(std::size_t i = 0; i < n; ++i)
    {
        auto const s = route_path(i);
        r.get(s, i);
        linear.push_back(pathway::compile_pattern(s));
    }
    pathway::route_table<std::size_t> t(std::move(r));

    auto const target = route_path(n - 1);
    auto const segs = pathway::split_path(target);
    std::size_t hits = 0;

    auto t0 = clock_type::now();
    for(std::size_t k = 0; k < iterations; ++k)
    {
        auto m = t.find_segments("GET", segs);
        if(m && m.handler() == n - 1)
            ++hits;
    }
    auto const trie = clock_type::now() - t0;

    t0 = clock_type::now();
    for(std::size_t k = 0; k < iterations; ++k)
    {
        for(auto const& p : linear)
        {
            if(pathway::match_pattern(p, segs))
            {
                ++hits;
                break;
            }
        }
    }
    auto const scan = clock_type::now() - t0;

    std::printf(
        "N=%-6zu table %10.1f ns/op   linear %10.1f ns/op   (%zu hits)\n",
        n,
        ns_per_op(trie, iterations),
        ns_per_op(scan, iterations),
        hits);
}

} // (anon)

int
main()
{
    bench(100, 20000);
    bench(1000, 20000);
    return 0;
}
