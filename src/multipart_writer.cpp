//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/formdata/multipart_writer.hpp>
#include <boost/formdata/boundary.hpp>
#include <boost/formdata/error.hpp>
#include <boost/formdata/file_source.hpp>
#include <boost/formdata/filename.hpp>
#include <boost/formdata/format.hpp>
#include <boost/formdata/mime_type.hpp>
#include <boost/formdata/detail/except.hpp>
#include <cstdint>

namespace boost {
namespace formdata {

namespace {

// Size of the buffer used to copy field content
constexpr std::size_t copy_buffer_size = 16384;

// Quote characters which would end the
// parameter value or the header line.
void
append_escaped(
    std::string& dest,
    core::string_view s)
{
    for(char c : s)
    {
        switch(c)
        {
        case '"':  dest.append("%22"); break;
        case '\r': dest.append("%0D"); break;
        case '\n': dest.append("%0A"); break;
        default:
            dest.push_back(c);
        }
    }
}

} // (anon)

//------------------------------------------------

multipart_writer::
multipart_writer(http_proto::sink& dest)
    : multipart_writer(dest, default_random_source())
{
}

multipart_writer::
multipart_writer(
    http_proto::sink& dest,
    random_source& rng)
    : dest_(dest)
    , boundary_(generate_boundary(rng))
    , log_(default_log_sections().get("formdata.writer"))
{
}

std::string
multipart_writer::
content_type() const
{
    return format("multipart/form-data; boundary={}", boundary_);
}

void
multipart_writer::
text(
    core::string_view name,
    core::string_view value)
{
    system::error_code ec;
    text(name, value, ec);
    if(ec.failed())
        detail::throw_sink_error(ec);
}

void
multipart_writer::
text(
    core::string_view name,
    core::string_view value,
    system::error_code& ec)
{
    check_usable();
    ec = {};
    write_field_headers(name, boost::none, boost::none, ec);
    if(ec.failed())
        return;
    write(value, true, ec);
    if(ec.failed())
        return;
    LOG_TRC(log_)("text field \"{}\", {} bytes", name, value.size());
}

void
multipart_writer::
stream(
    http_proto::source& src,
    core::string_view name,
    boost::optional<core::string_view> filename,
    boost::optional<core::string_view> content_type)
{
    system::error_code ec;
    stream(src, name, filename, content_type, ec);
    if(! ec.failed())
        return;
    if(failed_ == side::source)
        detail::throw_source_error(ec);
    detail::throw_sink_error(ec);
}

void
multipart_writer::
stream(
    http_proto::source& src,
    core::string_view name,
    boost::optional<core::string_view> filename,
    boost::optional<core::string_view> content_type,
    system::error_code& ec)
{
    check_usable();
    ec = {};

    // Always send a content type, otherwise
    // servers treat the part as inline text.
    if(! content_type)
        content_type.emplace(octet_stream);

    write_field_headers(name, filename, content_type, ec);
    if(ec.failed())
        return;

    char buf[copy_buffer_size];
    std::uint64_t total = 0;
    for(;;)
    {
        auto rs = src.read(
            buffers::mutable_buffer(buf, sizeof(buf)));
        if(rs.ec.failed())
        {
            fail(side::source, rs.ec);
            ec = rs.ec;
            return;
        }
        if(rs.bytes > 0)
        {
            write(core::string_view(buf, rs.bytes), true, ec);
            if(ec.failed())
                return;
            total += rs.bytes;
        }
        if(rs.finished)
            break;
    }
    LOG_TRC(log_)("stream field \"{}\", {} bytes", name, total);
}

void
multipart_writer::
file(
    core::string_view name,
    core::string_view path)
{
    system::error_code ec;
    file(name, path, ec);
    if(! ec.failed())
        return;
    if(failed_ == side::source)
        detail::throw_source_error(ec);
    detail::throw_sink_error(ec);
}

void
multipart_writer::
file(
    core::string_view name,
    core::string_view path,
    system::error_code& ec)
{
    check_usable();

    std::string const p(path.data(), path.size());
    file_source src(p.c_str(), ec);
    if(ec.failed())
    {
        LOG_DBG(log_)("open \"{}\" failed: {}", path, ec.message());
        fail(side::source, ec);
        return;
    }

    stream(src, name, formdata::filename(path), mime_type(path), ec);
}

std::string
multipart_writer::
finish()
{
    system::error_code ec;
    auto s = finish(ec);
    if(ec.failed())
        detail::throw_sink_error(ec);
    return s;
}

std::string
multipart_writer::
finish(system::error_code& ec)
{
    check_usable();
    ec = {};

    std::string s;
    if(data_written_)
        s.append("\r\n");
    format_to(s, "--{}--\r\n", boundary_);
    write(s, false, ec);
    if(ec.failed())
        return {};

    finished_ = true;
    LOG_DBG(log_)("finished, boundary {}", boundary_);
    return content_type();
}

//------------------------------------------------

void
multipart_writer::
check_usable() const
{
    if(finished_)
        detail::throw_logic_error(
            "multipart_writer: already finished");
    if(failed_ != side::none)
        detail::throw_logic_error(
            "multipart_writer: a previous operation failed");
}

void
multipart_writer::
fail(
    side s,
    system::error_code const& ec)
{
    failed_ = s;
    LOG_DBG(log_)("{} failure: {}",
        s == side::source ? "source" : "sink",
        ec.message());
}

void
multipart_writer::
write(
    core::string_view s,
    bool more,
    system::error_code& ec)
{
    if(s.empty() && more)
        return;
    auto rs = dest_.write(
        buffers::const_buffer(s.data(), s.size()), more);
    if(rs.ec.failed())
    {
        ec = rs.ec;
        fail(side::sink, ec);
        return;
    }
    if(rs.bytes != s.size())
    {
        ec = BOOST_FORMDATA_ERR(error::short_write);
        fail(side::sink, ec);
        return;
    }
}

void
multipart_writer::
write_boundary(system::error_code& ec)
{
    std::string s;
    if(data_written_)
        s.append("\r\n");
    format_to(s, "--{}\r\n", boundary_);
    write(s, true, ec);
}

void
multipart_writer::
write_field_headers(
    core::string_view name,
    boost::optional<core::string_view> filename,
    boost::optional<core::string_view> content_type,
    system::error_code& ec)
{
    write_boundary(ec);
    if(ec.failed())
        return;
    data_written_ = true;

    std::string s = "Content-Disposition: form-data; name=\"";
    append_escaped(s, name);
    s.push_back('"');
    if(filename)
    {
        s.append("; filename=\"");
        append_escaped(s, *filename);
        s.push_back('"');
    }
    if(content_type)
        format_to(s, "\r\nContent-Type: {}", *content_type);
    s.append("\r\n\r\n");
    write(s, true, ec);
}

} // formdata
} // boost
