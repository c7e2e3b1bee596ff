//
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/formdata/file_sink.hpp>
#include <boost/formdata/detail/except.hpp>

namespace boost {
namespace formdata {

file_sink::
file_sink(char const* path)
{
    system::error_code ec;
    f_.open(path, http_proto::file_mode::write, ec);
    if(ec.failed())
        detail::throw_system_error(ec);
}

void
file_sink::
close(system::error_code& ec)
{
    f_.close(ec);
}

auto
file_sink::
on_write(
    buffers::const_buffer b,
    bool) ->
        results
{
    results rs;
    rs.bytes = f_.write(b.data(), b.size(), rs.ec);
    n_ += rs.bytes;
    return rs;
}

} // formdata
} // boost
