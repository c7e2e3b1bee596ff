//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_MIME_TYPE_HPP
#define BOOST_FORMDATA_MIME_TYPE_HPP

#include <boost/formdata/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>

namespace boost {
namespace formdata {

/// The content type used when nothing better is known
constexpr char const* octet_stream = "application/octet-stream";

/** Return a reasonable mime type based on the extension of a file.

    The comparison is case-insensitive. When the
    extension is missing or unrecognized, the
    result is `application/octet-stream`.
*/
BOOST_FORMDATA_DECL
core::string_view
mime_type(core::string_view path) noexcept;

} // formdata
} // boost

#endif
