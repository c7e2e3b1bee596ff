//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_MULTIPART_WRITER_HPP
#define BOOST_FORMDATA_MULTIPART_WRITER_HPP

#include <boost/formdata/detail/config.hpp>
#include <boost/formdata/logger.hpp>
#include <boost/formdata/random_source.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/http_proto/sink.hpp>
#include <boost/http_proto/source.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>
#include <string>

namespace boost {
namespace formdata {

/** Writes a multipart/form-data body to a sink

    Each field is framed and written to the sink as
    soon as it is added; nothing is buffered by the
    writer itself. Field content is copied verbatim
    and never scanned, so the line break which ends
    a field is written lazily, in front of the next
    delimiter or by @ref finish.

    The boundary is generated once at construction
    and used for every delimiter and for the value
    returned by @ref content_type.

    The writer becomes unusable after @ref finish or
    after any operation fails; further calls throw
    `std::logic_error`.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.

    @see multipart_form
*/
class multipart_writer
{
public:
    /// Identifies which end of a failed operation was at fault
    enum class side
    {
        none,
        source,
        sink
    };

    multipart_writer(multipart_writer const&) = delete;
    multipart_writer& operator=(multipart_writer const&) = delete;

    /** Constructor

        The boundary is drawn from @ref default_random_source.

        @param dest The sink to write to. The sink
        must remain valid for the lifetime of the writer.
    */
    BOOST_FORMDATA_DECL
    explicit
    multipart_writer(http_proto::sink& dest);

    /** Constructor

        @param dest The sink to write to. The sink
        must remain valid for the lifetime of the writer.

        @param rng The source used to generate the boundary.
        It is only used during construction.
    */
    BOOST_FORMDATA_DECL
    multipart_writer(
        http_proto::sink& dest,
        random_source& rng);

    /** Return the boundary

        This is the value of the `boundary` parameter;
        delimiter lines in the body are this value
        preceded by `--`.
    */
    core::string_view
    boundary() const noexcept
    {
        return boundary_;
    }

    /** Return the value for the Content-Type header
    */
    BOOST_FORMDATA_DECL
    std::string
    content_type() const;

    /** Return true if @ref finish completed
    */
    bool
    is_finished() const noexcept
    {
        return finished_;
    }

    /** Return the side at fault for the last failure
    */
    side
    failed_side() const noexcept
    {
        return failed_;
    }

    /** Add a text field

        @param name The field name.
        @param value The field value, written as-is.
        @throws sink_error The sink failed.
    */
    BOOST_FORMDATA_DECL
    void
    text(
        core::string_view name,
        core::string_view value);

    /** Add a text field

        @param ec Set to the error if the sink failed.
    */
    BOOST_FORMDATA_DECL
    void
    text(
        core::string_view name,
        core::string_view value,
        system::error_code& ec);

    /** Add a field whose content is read from a source

        A Content-Type line is always written, using
        `application/octet-stream` when `content_type`
        is empty, so that servers treat the part as a
        file. The source is read until it reports that
        it is finished.

        @param src The source of the field content.
        @param name The field name.
        @param filename The optional filename attribute.
        @param content_type The optional content type.

        @throws source_error Reading the source failed.
        @throws sink_error Writing to the sink failed.
    */
    BOOST_FORMDATA_DECL
    void
    stream(
        http_proto::source& src,
        core::string_view name,
        boost::optional<core::string_view> filename = boost::none,
        boost::optional<core::string_view> content_type = boost::none);

    /** Add a field whose content is read from a source

        @param ec Set to the error on failure. Use
        @ref failed_side to tell a source failure
        from a sink failure.
    */
    BOOST_FORMDATA_DECL
    void
    stream(
        http_proto::source& src,
        core::string_view name,
        boost::optional<core::string_view> filename,
        boost::optional<core::string_view> content_type,
        system::error_code& ec);

    /** Add a field whose content is read from a file

        The content type is guessed from the extension
        and the filename attribute is the final
        component of `path`, if it has one.

        @throws source_error The file could not be
        opened or read.
        @throws sink_error Writing to the sink failed.
    */
    BOOST_FORMDATA_DECL
    void
    file(
        core::string_view name,
        core::string_view path);

    /** Add a field whose content is read from a file

        @param ec Set to the error on failure.
    */
    BOOST_FORMDATA_DECL
    void
    file(
        core::string_view name,
        core::string_view path,
        system::error_code& ec);

    /** Write the closing delimiter

        The closing delimiter is written even when no
        fields were added.

        @return The value for the Content-Type header.
        @throws sink_error Writing to the sink failed.
    */
    BOOST_FORMDATA_DECL
    std::string
    finish();

    /** Write the closing delimiter

        @param ec Set to the error if the sink failed.
    */
    BOOST_FORMDATA_DECL
    std::string
    finish(system::error_code& ec);

private:
    void check_usable() const;
    void fail(side, system::error_code const&);
    void write(core::string_view, bool, system::error_code&);
    void write_boundary(system::error_code&);
    void write_field_headers(
        core::string_view,
        boost::optional<core::string_view>,
        boost::optional<core::string_view>,
        system::error_code&);

    http_proto::sink& dest_;
    std::string boundary_;
    section log_;
    bool data_written_ = false;
    bool finished_ = false;
    side failed_ = side::none;
};

} // formdata
} // boost

#endif
