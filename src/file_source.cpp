//
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/formdata/file_source.hpp>

namespace boost {
namespace formdata {

file_source::
file_source(
    char const* path,
    system::error_code& ec)
{
    f_.open(path, http_proto::file_mode::read, ec);
}

auto
file_source::
on_read(
    buffers::mutable_buffer b) ->
        results
{
    results rs;
    rs.bytes = f_.read(b.data(), b.size(), rs.ec);
    if(rs.ec.failed())
        return rs;
    n_ += rs.bytes;
    if(rs.bytes == 0)
        rs.finished = true;
    return rs;
}

} // formdata
} // boost
