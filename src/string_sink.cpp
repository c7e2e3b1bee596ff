//
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/formdata/string_sink.hpp>
#include <utility>

namespace boost {
namespace formdata {

std::string
string_sink::
release() noexcept
{
    std::string s = std::move(s_);
    s_.clear();
    return s;
}

auto
string_sink::
on_write(
    buffers::const_buffer b,
    bool) ->
        results
{
    results rs;
    s_.append(
        static_cast<char const*>(b.data()),
        b.size());
    rs.bytes = b.size();
    return rs;
}

} // formdata
} // boost
