//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/formdata/detail/except.hpp>
#include <boost/formdata/error.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>
#include <string>

namespace boost {
namespace formdata {
namespace detail {

void
throw_logic_error(
    core::string_view s,
    source_location const& loc)
{
    throw_exception(std::logic_error(
        std::string(s.data(), s.size())), loc);
}

void
throw_system_error(
    system::error_code const& ec,
    source_location const& loc)
{
    throw_exception(system::system_error(ec), loc);
}

void
throw_source_error(
    system::error_code const& ec,
    source_location const& loc)
{
    throw_exception(source_error(ec), loc);
}

void
throw_sink_error(
    system::error_code const& ec,
    source_location const& loc)
{
    throw_exception(sink_error(ec), loc);
}

} // detail
} // formdata
} // boost
