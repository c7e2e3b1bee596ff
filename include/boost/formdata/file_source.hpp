//
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_FILE_SOURCE_HPP
#define BOOST_FORMDATA_FILE_SOURCE_HPP

#include <boost/formdata/detail/config.hpp>
#include <boost/http_proto/file.hpp>
#include <boost/http_proto/source.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <utility>

namespace boost {
namespace formdata {

/** A source which reads a file to the end

    Pass this source to @ref multipart_writer::stream
    to send a file under a filename or content type
    other than the ones derived from its path.
*/
class BOOST_FORMDATA_CLASS_DECL file_source
    : public http_proto::source
{
    http_proto::file f_;
    std::uint64_t n_ = 0;

public:
    /** Constructor

        The source takes ownership of an open file.
    */
    explicit
    file_source(http_proto::file&& f) noexcept
        : f_(std::move(f))
    {
    }

    /** Constructor

        Opens `path` for reading.

        @param ec Set to the error if the
        file could not be opened.
    */
    BOOST_FORMDATA_DECL
    file_source(
        char const* path,
        system::error_code& ec);

    /** Return the number of bytes read so far
    */
    std::uint64_t
    size() const noexcept
    {
        return n_;
    }

protected:
    BOOST_FORMDATA_DECL
    results
    on_read(buffers::mutable_buffer b) override;
};

} // formdata
} // boost

#endif
