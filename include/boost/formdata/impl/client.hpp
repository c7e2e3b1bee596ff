//
// Copyright (c) 2016-2019 Vinnie Falco (vinnie dot falco at gmail dot com)
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_IMPL_CLIENT_HPP
#define BOOST_FORMDATA_IMPL_CLIENT_HPP

#include <boost/formdata/detail/except.hpp>
#include <boost/assert.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/http_proto/error.hpp>
#include <boost/http_proto/parser.hpp>
#include <boost/http_proto/response_parser.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace boost {
namespace formdata {

namespace detail {

// Move the body bytes held by the parser into `body`.
inline
void
drain_body(
    http_proto::parser& pr,
    std::string& body)
{
    for(auto cb : pr.pull_body())
    {
        body.append(
            static_cast<char const*>(cb.data()),
            cb.size());
        pr.consume_body(cb.size());
    }
}

// Read from the stream into the parser until the
// complete message has been parsed, appending the
// body to `body` as it arrives.
template<class SyncReadStream>
std::size_t
read_complete(
    SyncReadStream& stream,
    http_proto::parser& pr,
    std::string& body,
    std::uint64_t body_limit,
    system::error_code& ec)
{
    std::size_t total = 0;
    for(;;)
    {
        pr.parse(ec);
        if(pr.got_header())
        {
            drain_body(pr, body);
            if(body.size() > body_limit)
            {
                ec = http_proto::error::body_too_large;
                return total;
            }
        }
        if(ec == http_proto::condition::need_more_input)
        {
            std::size_t const n =
                stream.read_some(pr.prepare(), ec);
            pr.commit(n);
            total += n;
            if(ec == asio::error::eof)
            {
                BOOST_ASSERT(n == 0);
                pr.commit_eof();
                ec = {};
            }
            else if(ec.failed())
            {
                return total;
            }
            continue;
        }
        if(ec.failed() || pr.is_complete())
            return total;
    }
}

} // detail

template<class SyncStream>
template<class... Args, class>
client<SyncStream>::
client(Args&&... args)
    : log_(default_log_sections().get("formdata.client"))
    , stream_(std::forward<Args>(args)...)
{
    http_proto::install_parser_service(ctx_, {});
}

template<class SyncStream>
response
client<SyncStream>::
send(
    http_proto::request const& req,
    core::string_view body,
    system::error_code& ec)
{
    core::string_view const header = req.buffer();
    std::array<asio::const_buffer, 2> const bufs = {{
        asio::const_buffer(header.data(), header.size()),
        asio::const_buffer(body.data(), body.size()) }};

    asio::write(stream_, bufs, ec);
    if(ec.failed())
    {
        LOG_DBG(log_)("write failed: {}", ec.message());
        return {};
    }
    LOG_TRC(log_)("sent {} header and {} body bytes",
        header.size(), body.size());

    http_proto::response_parser pr(ctx_);
    pr.reset();
    pr.start();
    pr.set_body_limit(params_.body_limit);

    response res;
    auto const n = detail::read_complete(
        stream_, pr, res.body, params_.body_limit, ec);
    if(ec.failed())
    {
        LOG_DBG(log_)("read failed after {} bytes: {}", n, ec.message());
        return {};
    }

    auto const& h = pr.get();
    res.status = h.status();
    res.status_int = h.status_int();
    core::string_view const hs = h.buffer();
    res.header.assign(hs.data(), hs.size());
    LOG_DBG(log_)("response {}, {} body bytes",
        res.status_int, res.body.size());
    return res;
}

template<class SyncStream>
response
client<SyncStream>::
send(
    http_proto::request const& req,
    core::string_view body)
{
    system::error_code ec;
    auto res = send(req, body, ec);
    if(ec.failed())
        detail::throw_system_error(ec);
    return res;
}

} // formdata
} // boost

#endif
