//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/logger.hpp>
#include <atomic>
#include <iostream>
#include <mutex>
#include <unordered_map>

namespace pathway {

namespace {

struct sink
{
    std::ostream& os;
    std::mutex m;

    explicit sink(std::ostream& os_)
        : os(os_)
    {
    }

    void
    write(core::string_view s)
    {
        std::lock_guard<std::mutex> lock(m);
        os << s << std::endl;
    }
};

} // (anon)

struct section::impl
{
    std::string name;
    std::atomic<int> level;
    std::shared_ptr<sink> out;

    impl(
        core::string_view name_,
        int level_,
        std::shared_ptr<sink> out_)
        : name(name_.data(), name_.size())
        , level(level_)
        , out(std::move(out_))
    {
    }
};

section::
section() noexcept = default;

section::
section(std::shared_ptr<impl> p) noexcept
    : impl_(std::move(p))
{
}

int
section::
threshold() const noexcept
{
    if(! impl_)
        return disabled;
    return impl_->level.load(
        std::memory_order_relaxed);
}

void
section::
set_threshold(int level) noexcept
{
    if(impl_)
        impl_->level.store(level,
            std::memory_order_relaxed);
}

core::string_view
section::
name() const noexcept
{
    if(! impl_)
        return {};
    return impl_->name;
}

void
section::
format_impl(
    core::string_view fs,
    char const* data,
    std::size_t* plen,
    std::size_t n) const
{
    if(! impl_)
        return;
    std::string s = impl_->name;
    s.push_back(' ');
    char const* p = fs.data();
    char const* end = fs.data() + fs.size();
    auto p0 = p;
    while(p != end)
    {
        if(*p++ != '{')
            continue;
        if(p == end)
            break;
        if(*p++ != '}')
            continue;
        s.append(p0, p - p0 - 2);
        if(n)
        {
            s.append(data, *plen);
            data += *plen++;
            --n;
        }
        p0 = p;
    }
    s.append(p0, end - p0);
    impl_->out->write(s);
}

//------------------------------------------------

struct log_sections::impl
{
    struct hash
    {
        std::size_t
        operator()(core::string_view const& s) const noexcept
        {
        #if SIZE_MAX == 4294967295U
            std::size_t hash = 2166136261; // FNV offset basis
            for (unsigned char c : s)
                hash ^= c, hash *= 16777619;   // FNV prime
        #else
            std::size_t hash = 1469598103934665603; // FNV offset basis
            for (unsigned char c : s)
                hash ^= c, hash *= 1099511628211;   // FNV prime
        #endif
            return hash;
        }
    };

    std::shared_ptr<sink> out;

    // keys refer to the name owned by the section
    std::unordered_map<core::string_view, section, hash> map;

    explicit impl(std::ostream& os)
        : out(std::make_shared<sink>(os))
    {
    }
};

log_sections::
~log_sections()
{
    delete impl_;
}

log_sections::
log_sections()
    : impl_(new impl(std::cerr))
{
}

log_sections::
log_sections(std::ostream& os)
    : impl_(new impl(os))
{
}

section
log_sections::
get(core::string_view name)
{
    auto it = impl_->map.find(name);
    if(it != impl_->map.end())
        return it->second;
    section sect(std::make_shared<section::impl>(
        name, default_threshold, impl_->out));
    auto const key = sect.name();
    impl_->map.emplace(key, sect);
    return sect;
}

} // pathway
