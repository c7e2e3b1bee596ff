//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/formdata/boundary.hpp>
#include <algorithm>

namespace boost {
namespace formdata {

std::string
generate_boundary(random_source& rng)
{
    // Values at or above the largest multiple of ten
    // are redrawn so every digit is equally likely.
    constexpr random_source::result_type limit =
        (random_source::max)() - (random_source::max)() % 10;
    std::string rs(boundary_size, '-');
    std::generate(
        rs.begin() + boundary_prefix_size,
        rs.end(),
        [&]
        {
            auto v = rng();
            while(v >= limit)
                v = rng();
            return static_cast<char>('0' + v % 10);
        });
    return rs;
}

} // formdata
} // boost
