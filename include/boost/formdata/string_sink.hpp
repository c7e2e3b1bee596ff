//
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_STRING_SINK_HPP
#define BOOST_FORMDATA_STRING_SINK_HPP

#include <boost/formdata/detail/config.hpp>
#include <boost/http_proto/sink.hpp>
#include <string>

namespace boost {
namespace formdata {

/** A sink which appends to an owned string

    Writes always succeed, short of an allocation
    failure.
*/
class BOOST_FORMDATA_CLASS_DECL string_sink
    : public http_proto::sink
{
    std::string s_;

public:
    string_sink() = default;

    /** Return the bytes written so far
    */
    std::string const&
    str() const noexcept
    {
        return s_;
    }

    /** Return the bytes written and leave the sink empty
    */
    BOOST_FORMDATA_DECL
    std::string
    release() noexcept;

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
