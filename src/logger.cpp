//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/formdata/logger.hpp>
#include <iostream>
#include <map>
#include <mutex>
#include <utility>

namespace boost {
namespace formdata {

section::
section() noexcept = default;

// Lines from different threads are not interleaved
void
section::
write(core::string_view s)
{
    static std::mutex m;
    std::lock_guard<std::mutex> lock(m);
    std::cerr.write(s.data(), static_cast<
        std::streamsize>(s.size())).put('\n').flush();
}

section::
section(core::string_view name)
    : impl_(std::make_shared<impl>())
{
    impl_->name = std::string(name.data(), name.size());
}

//------------------------------------------------

// Sections are kept sorted by name
struct log_sections::impl
{
    mutable std::mutex m;
    std::map<std::string, section> map;
    log_level level = log_level::warning;
};

log_sections::
~log_sections()
{
    delete impl_;
}

log_sections::
log_sections()
    : impl_(new impl)
{
}

section
log_sections::
get(core::string_view name)
{
    std::lock_guard<std::mutex> lock(impl_->m);
    std::string key(name.data(), name.size());
    auto it = impl_->map.find(key);
    if(it == impl_->map.end())
    {
        section v(name);
        v.set_threshold(impl_->level);
        it = impl_->map.emplace(std::move(key), v).first;
    }
    return it->second;
}

std::vector<section>
log_sections::
get_sections() const
{
    std::lock_guard<std::mutex> lock(impl_->m);
    std::vector<section> v;
    v.reserve(impl_->map.size());
    for(auto const& e : impl_->map)
        v.push_back(e.second);
    return v;
}

void
log_sections::
set_threshold(log_level level)
{
    std::lock_guard<std::mutex> lock(impl_->m);
    impl_->level = level;
    for(auto& e : impl_->map)
        e.second.set_threshold(level);
}

log_sections&
default_log_sections()
{
    static log_sections ls;
    return ls;
}

} // formdata
} // boost
