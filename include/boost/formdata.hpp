//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_HPP
#define BOOST_FORMDATA_HPP

#include <boost/formdata/boundary.hpp>
#include <boost/formdata/client.hpp>
#include <boost/formdata/error.hpp>
#include <boost/formdata/file_sink.hpp>
#include <boost/formdata/file_source.hpp>
#include <boost/formdata/filename.hpp>
#include <boost/formdata/format.hpp>
#include <boost/formdata/logger.hpp>
#include <boost/formdata/mime_type.hpp>
#include <boost/formdata/multipart_form.hpp>
#include <boost/formdata/multipart_writer.hpp>
#include <boost/formdata/random_source.hpp>
#include <boost/formdata/send.hpp>
#include <boost/formdata/string_sink.hpp>

#endif
