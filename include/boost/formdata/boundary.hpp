//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_BOUNDARY_HPP
#define BOOST_FORMDATA_BOUNDARY_HPP

#include <boost/formdata/detail/config.hpp>
#include <boost/formdata/random_source.hpp>
#include <cstddef>
#include <string>

namespace boost {
namespace formdata {

/// Number of hyphens which begin every boundary
constexpr std::size_t boundary_prefix_size = 27;

/// Number of random digits which follow the hyphens
constexpr std::size_t boundary_token_size = 29;

/// Total length of a generated boundary
constexpr std::size_t boundary_size =
    boundary_prefix_size + boundary_token_size;

/** Return a new multipart boundary

    The boundary is a run of @ref boundary_prefix_size
    hyphens followed by @ref boundary_token_size decimal
    digits drawn from `rng`. This is the value which
    appears after `boundary=` in the Content-Type
    header; delimiter lines in the body add a
    further `--` in front of it.

    Each digit is the remainder modulo ten of one
    value drawn from `rng`, so a given sequence of
    values yields the same boundary on every platform.

    @param rng The source of randomness.
*/
BOOST_FORMDATA_DECL
std::string
generate_boundary(random_source& rng);

} // formdata
} // boost

#endif
