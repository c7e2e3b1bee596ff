//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/formdata/multipart_form.hpp>

namespace boost {
namespace formdata {

multipart_form::
multipart_form()
    : w_(sink_)
{
}

multipart_form::
multipart_form(random_source& rng)
    : w_(sink_, rng)
{
}

multipart_form&
multipart_form::
add_text(
    core::string_view name,
    core::string_view text)
{
    w_.text(name, text);
    return *this;
}

multipart_form&
multipart_form::
add_stream(
    http_proto::source& src,
    core::string_view name,
    boost::optional<core::string_view> filename,
    boost::optional<core::string_view> content_type)
{
    w_.stream(src, name, filename, content_type);
    return *this;
}

multipart_form&
multipart_form::
add_file(
    core::string_view name,
    core::string_view path)
{
    w_.file(name, path);
    return *this;
}

form_body
multipart_form::
finish()
{
    form_body fb;
    fb.content_type = w_.finish();
    fb.body = sink_.release();
    return fb;
}

} // formdata
} // boost
