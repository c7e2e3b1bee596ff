//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_DETAIL_EXCEPT_HPP
#define BOOST_FORMDATA_DETAIL_EXCEPT_HPP

#include <boost/formdata/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace formdata {
namespace detail {

BOOST_FORMDATA_DECL void BOOST_NORETURN throw_logic_error(
    core::string_view s,
    source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_FORMDATA_DECL void BOOST_NORETURN throw_system_error(
    system::error_code const& ec,
    source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_FORMDATA_DECL void BOOST_NORETURN throw_source_error(
    system::error_code const& ec,
    source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_FORMDATA_DECL void BOOST_NORETURN throw_sink_error(
    system::error_code const& ec,
    source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // formdata
} // boost

#endif
