//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_CLIENT_HPP
#define BOOST_FORMDATA_CLIENT_HPP

#include <boost/formdata/detail/config.hpp>
#include <boost/formdata/logger.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/http_proto/request.hpp>
#include <boost/http_proto/status.hpp>
#include <boost/rts/polystore.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace boost {
namespace formdata {

/** Parameters for @ref client
*/
struct client_params
{
    /** The largest response body accepted

        Larger bodies fail with
        `http_proto::error::body_too_large`.
    */
    std::uint64_t body_limit = 64 * 1024 * 1024;
};

/** A response received by @ref client
*/
struct response
{
    http_proto::status status = http_proto::status::unknown;
    unsigned short status_int = 0;

    /// The serialized start line and header fields
    std::string header;

    /// The complete body
    std::string body;
};

/** A blocking HTTP/1.1 client

    The client sends one request at a time on a stream
    which the caller has already connected, and reads
    the complete response. The stream type must meet the
    requirements of <em>SyncReadStream</em> and
    <em>SyncWriteStream</em>; `asio::ip::tcp::socket`
    is typical. Establishing, reusing and closing the
    connection are the caller's responsibility.

    Errors from the stream or from parsing the response
    are reported unchanged. A response with any status
    code is a success.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.
*/
template<class SyncStream>
class client
{
public:
    using stream_type = typename
        std::remove_reference<SyncStream>::type;

    /** Constructor

        The arguments are forwarded to the stream.
    */
    template<
        class... Args,
        class = typename std::enable_if<
            std::is_constructible<
                SyncStream, Args...>::value>::type
    >
    explicit
    client(Args&&... args);

    stream_type const&
    stream() const noexcept
    {
        return stream_;
    }

    stream_type&
    stream() noexcept
    {
        return stream_;
    }

    client_params const&
    params() const noexcept
    {
        return params_;
    }

    void
    set_params(client_params const& params) noexcept
    {
        params_ = params;
    }

    /** Send a request and read the response

        The header in `req` is written as-is, followed by
        `body`. The caller is responsible for setting a
        Content-Length which matches `body`.

        @param req The request header.
        @param body The request body.
        @param ec Set to the transport error, if any.
        @return The response. Unspecified on error.
    */
    response
    send(
        http_proto::request const& req,
        core::string_view body,
        system::error_code& ec);

    /** Send a request and read the response

        @throws system::system_error on transport error.
    */
    response
    send(
        http_proto::request const& req,
        core::string_view body);

private:
    rts::polystore ctx_;
    client_params params_;
    section log_;
    SyncStream stream_;
};

} // formdata
} // boost

#include <boost/formdata/impl/client.hpp>

#endif
