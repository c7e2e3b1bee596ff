//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_FILENAME_HPP
#define BOOST_FORMDATA_FILENAME_HPP

#include <boost/formdata/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional.hpp>

namespace boost {
namespace formdata {

namespace detail {

// Characters which separate path components
#ifdef _WIN32
constexpr char const* path_separators = "/\\";
#else
constexpr char const* path_separators = "/";
#endif

} // detail

/** Return the final component of a path

    Components are separated by `/`, and on Windows
    also by `\`. Trailing separators are ignored. There is no
    final component when the path is empty, consists
    only of separators, or ends in `..`.

    @par Example
    @code
    assert( filename("dir/sample.txt").value() == "sample.txt" );
    assert( filename("dir/sub/").value() == "sub" );
    assert( ! filename("../..") );
    @endcode
*/
BOOST_FORMDATA_DECL
boost::optional<core::string_view>
filename(core::string_view path) noexcept;

} // formdata
} // boost

#endif
