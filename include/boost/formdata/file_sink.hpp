//
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_FILE_SINK_HPP
#define BOOST_FORMDATA_FILE_SINK_HPP

#include <boost/formdata/detail/config.hpp>
#include <boost/http_proto/file.hpp>
#include <boost/http_proto/sink.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <utility>

namespace boost {
namespace formdata {

/** A sink which writes to a file

    Use this sink with @ref multipart_writer to
    build bodies too large to hold in memory. The
    file is truncated when opened.
*/
class BOOST_FORMDATA_CLASS_DECL file_sink
    : public http_proto::sink
{
    http_proto::file f_;
    std::uint64_t n_ = 0;

public:
    /** Constructor

        The sink takes ownership of an open file.
    */
    explicit
    file_sink(http_proto::file&& f) noexcept
        : f_(std::move(f))
    {
    }

    /** Constructor

        Opens `path` for writing, creating or
        truncating it.

        @throws system::system_error on failure.
    */
    BOOST_FORMDATA_DECL
    explicit
    file_sink(char const* path);

    /** Return the number of bytes written so far
    */
    std::uint64_t
    size() const noexcept
    {
        return n_;
    }

    /** Close the file
    */
    BOOST_FORMDATA_DECL
    void
    close(system::error_code& ec);

protected:
    BOOST_FORMDATA_DECL
    results
    on_write(
        buffers::const_buffer b,
        bool more) override;
};

} // formdata
} // boost

#endif
