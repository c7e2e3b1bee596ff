//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_RANDOM_SOURCE_HPP
#define BOOST_FORMDATA_RANDOM_SOURCE_HPP

#include <boost/formdata/detail/config.hpp>
#include <cstdint>
#include <limits>

namespace boost {
namespace formdata {

/** A source of random bits used to generate boundaries

    This class meets the requirements of
    <em>UniformRandomBitGenerator</em>, so it may be
    passed to the distributions in `<random>`.
    Derived classes provide the bits by overriding
    @ref next. Tests substitute a deterministic
    source to obtain reproducible output.

    @see default_random_source
*/
class BOOST_SYMBOL_VISIBLE
    random_source
{
public:
    using result_type = std::uint32_t;

    virtual ~random_source() = default;

    static constexpr
    result_type
    min() noexcept
    {
        return (std::numeric_limits<result_type>::min)();
    }

    static constexpr
    result_type
    max() noexcept
    {
        return (std::numeric_limits<result_type>::max)();
    }

    result_type
    operator()()
    {
        return next();
    }

protected:
    /** Return the next value in the sequence
    */
    virtual
    result_type
    next() = 0;
};

/** Return the process-wide random source

    The returned source is seeded once from
    `std::random_device` the first time this
    function is called. Calls from different
    threads are serialized.
*/
BOOST_FORMDATA_DECL
random_source&
default_random_source();

} // formdata
} // boost

#endif
