//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/formdata/filename.hpp>

namespace boost {
namespace formdata {

boost::optional<core::string_view>
filename(core::string_view path) noexcept
{
    for(;;)
    {
        auto const last =
            path.find_last_not_of(detail::path_separators);
        if(last == core::string_view::npos)
            return boost::none;
        path = path.substr(0, last + 1);

        auto const pos = path.find_last_of(detail::path_separators);
        auto const name = (pos == core::string_view::npos)
            ? path : path.substr(pos + 1);
        if(name == "..")
            return boost::none;
        if(name != ".")
            return name;

        // "dir/." names "dir"
        if(pos == core::string_view::npos)
            return boost::none;
        path = path.substr(0, pos);
    }
}

} // formdata
} // boost
