//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_DETAIL_CONFIG_HPP
#define BOOST_FORMDATA_DETAIL_CONFIG_HPP

#include <boost/config.hpp>

namespace boost {
namespace formdata {

# if (defined(BOOST_FORMDATA_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_FORMDATA_STATIC_LINK)
#  if defined(BOOST_FORMDATA_SOURCE)
#   define BOOST_FORMDATA_DECL        BOOST_SYMBOL_EXPORT
#   define BOOST_FORMDATA_CLASS_DECL  BOOST_SYMBOL_EXPORT
#   define BOOST_FORMDATA_BUILD_DLL
#  else
#   define BOOST_FORMDATA_DECL        BOOST_SYMBOL_IMPORT
#   define BOOST_FORMDATA_CLASS_DECL  BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib
# ifndef  BOOST_FORMDATA_DECL
#  define BOOST_FORMDATA_DECL
# endif
# ifndef  BOOST_FORMDATA_CLASS_DECL
#  define BOOST_FORMDATA_CLASS_DECL
# endif

//------------------------------------------------

// Add source location to error codes
#ifdef BOOST_FORMDATA_NO_SOURCE_LOCATION
# define BOOST_FORMDATA_ERR(ev) (::boost::system::error_code(ev))
#else
# define BOOST_FORMDATA_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
#endif

} // formdata
} // boost

#endif
