//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_SEND_HPP
#define BOOST_FORMDATA_SEND_HPP

#include <boost/formdata/detail/config.hpp>
#include <boost/formdata/filename.hpp>
#include <boost/formdata/logger.hpp>
#include <boost/formdata/multipart_form.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/http_proto/field.hpp>
#include <boost/http_proto/request.hpp>

namespace boost {
namespace formdata {

namespace detail {

inline
section&
send_log()
{
    static section s =
        default_log_sections().get("formdata.send");
    return s;
}

// Set the headers describing a finished body
inline
void
set_body_headers(
    http_proto::request& req,
    form_body const& fb)
{
    req.set(http_proto::field::content_type, fb.content_type);
    req.set_content_length(fb.body.size());
}

} // detail

/** Send a single file as a multipart/form-data request

    The file is encoded as the only field of the body,
    the Content-Type and Content-Length fields of `req`
    are set to match, and the request is sent with
    `client.send(req, body)`. The method and target of
    `req` are left as the caller set them.

    @param client An object with a member function
    `send(http_proto::request&, core::string_view)`,
    such as @ref client. Its result, and any exception
    it throws, are passed through unchanged.
    @param req The request to send.
    @param name The field name.
    @param path The path of the file.

    @throws source_error The file could not be opened
    or read. Nothing is sent.
*/
template<class Client>
auto
send_multipart_file(
    Client& client,
    http_proto::request& req,
    core::string_view name,
    core::string_view path) ->
        decltype(client.send(req, core::string_view()))
{
    multipart_form form;
    form.add_file(name, path);
    auto const fb = form.finish();
    detail::set_body_headers(req, fb);
    LOG_DBG(detail::send_log())(
        "sending \"{}\" as field \"{}\", {} bytes",
        path, name, fb.body.size());
    return client.send(req, fb.body);
}

/** Send files as a multipart/form-data request

    Each file becomes one field, in the order given,
    and each field is named after the final component
    of its path. Otherwise this behaves like
    @ref send_multipart_file.

    @param paths A range whose elements convert to
    `core::string_view`.

    @throws source_error A file could not be opened
    or read. Nothing is sent.
*/
template<class Client, class PathRange>
auto
send_multipart_files(
    Client& client,
    http_proto::request& req,
    PathRange const& paths) ->
        decltype(client.send(req, core::string_view()))
{
    multipart_form form;
    std::size_t n = 0;
    for(auto const& p : paths)
    {
        core::string_view const path(p);
        auto const name = filename(path);
        form.add_file(name ? *name : core::string_view(), path);
        ++n;
    }
    auto const fb = form.finish();
    detail::set_body_headers(req, fb);
    LOG_DBG(detail::send_log())(
        "sending {} files, {} bytes", n, fb.body.size());
    return client.send(req, fb.body);
}

} // formdata
} // boost

#endif
