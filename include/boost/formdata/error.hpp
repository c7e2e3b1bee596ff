//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_ERROR_HPP
#define BOOST_FORMDATA_ERROR_HPP

#include <boost/formdata/detail/config.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <boost/system/system_error.hpp>
#include <type_traits>

namespace boost {
namespace formdata {

/** Error codes
*/
enum class error
{
    success = 0,

    /** A sink accepted fewer bytes than it was given

        The sink reported success but did not consume
        the whole buffer.
    */
    short_write
};

} // formdata

namespace system {
template<>
struct is_error_code_enum<
    ::boost::formdata::error>
{
    static bool const value = true;
};
} // system

namespace formdata {

namespace detail {
struct BOOST_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    BOOST_FORMDATA_DECL const char* name(
        ) const noexcept override;
    BOOST_FORMDATA_DECL std::string message(
        int) const override;
    BOOST_FORMDATA_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x8c3f2b9a61d04e75 )
    {
    }
};
BOOST_FORMDATA_DECL extern error_cat_type error_cat;
} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

//------------------------------------------------

/** Thrown when reading a field's content failed

    The file or stream supplying the bytes of a
    field could not be opened or read. The
    underlying I/O error is available through
    `code()`.
*/
class BOOST_SYMBOL_VISIBLE source_error
    : public system::system_error
{
public:
    explicit
    source_error(system::error_code const& ec)
        : system::system_error(ec, "multipart source")
    {
    }
};

/** Thrown when writing the encoded body failed

    The destination of the multipart body rejected
    a write. The underlying I/O error is available
    through `code()`.
*/
class BOOST_SYMBOL_VISIBLE sink_error
    : public system::system_error
{
public:
    explicit
    sink_error(system::error_code const& ec)
        : system::system_error(ec, "multipart sink")
    {
    }
};

} // formdata
} // boost

#endif
