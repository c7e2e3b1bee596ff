//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_MULTIPART_FORM_HPP
#define BOOST_FORMDATA_MULTIPART_FORM_HPP

#include <boost/formdata/detail/config.hpp>
#include <boost/formdata/multipart_writer.hpp>
#include <boost/formdata/random_source.hpp>
#include <boost/formdata/string_sink.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/http_proto/source.hpp>
#include <boost/optional.hpp>
#include <string>

namespace boost {
namespace formdata {

/** A finished multipart/form-data body
*/
struct form_body
{
    /// The value for the Content-Type header
    std::string content_type;

    /// The encoded body
    std::string body;
};

/** Builds a multipart/form-data body in memory

    Fields appear in the body in the order they
    are added. Each `add_*` function returns a
    reference to the form so calls can be chained:

    @code
    form_body fb = multipart_form()
        .add_file("test", "1.txt")
        .add_text("name", "value")
        .finish();
    @endcode

    After @ref finish, or after any `add_*` function
    throws, the form must not be used again.

    @see multipart_writer
*/
class multipart_form
{
    string_sink sink_;
    multipart_writer w_;

public:
    multipart_form(multipart_form const&) = delete;
    multipart_form& operator=(multipart_form const&) = delete;

    /** Constructor

        The boundary is drawn from @ref default_random_source.
    */
    BOOST_FORMDATA_DECL
    multipart_form();

    /** Constructor

        @param rng The source used to generate the boundary.
    */
    BOOST_FORMDATA_DECL
    explicit
    multipart_form(random_source& rng);

    /** Return the boundary
    */
    core::string_view
    boundary() const noexcept
    {
        return w_.boundary();
    }

    /** Add a text field

        @throws sink_error
    */
    BOOST_FORMDATA_DECL
    multipart_form&
    add_text(
        core::string_view name,
        core::string_view text);

    /** Add a field whose content is read from a source

        @throws source_error Reading the source failed.
        @throws sink_error
    */
    BOOST_FORMDATA_DECL
    multipart_form&
    add_stream(
        http_proto::source& src,
        core::string_view name,
        boost::optional<core::string_view> filename = boost::none,
        boost::optional<core::string_view> content_type = boost::none);

    /** Add a field whose content is read from a file

        @throws source_error The file could not be
        opened or read.
        @throws sink_error
    */
    BOOST_FORMDATA_DECL
    multipart_form&
    add_file(
        core::string_view name,
        core::string_view path);

    /** Finish the body

        @return The Content-Type header value and the body.
    */
    BOOST_FORMDATA_DECL
    form_body
    finish();
};

} // formdata
} // boost

#endif
