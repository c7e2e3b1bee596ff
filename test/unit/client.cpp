//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/formdata/client.hpp>

#include <boost/http_proto/error.hpp>
#include <boost/http_proto/field.hpp>
#include <boost/http_proto/method.hpp>
#include <boost/system/system_error.hpp>
#include <string>

#include "test_helpers.hpp"

namespace boost {
namespace formdata {

struct client_test
{
    static
    http_proto::request
    make_request()
    {
        http_proto::request req;
        req.set_method(http_proto::method::post);
        req.set_target("/upload");
        req.set(http_proto::field::host, "example.com");
        req.set_content_length(5);
        return req;
    }

    void
    testSend()
    {
        auto const req = make_request();
        for(std::size_t n : { std::size_t(1), std::size_t(3), std::size_t(-1) })
        {
            client<test::sync_stream> c(
                "HTTP/1.1 201 Created\r\n"
                "Content-Length: 5\r\n"
                "\r\n"
                "hello");
            c.stream().read_size(n);
            system::error_code ec;
            auto const res = c.send(req, "a=b&c", ec);
            BOOST_TEST(! ec.failed());
            BOOST_TEST(res.status == http_proto::status::created);
            BOOST_TEST_EQ(res.status_int, 201);
            BOOST_TEST_EQ(res.body, "hello");
            BOOST_TEST_EQ(res.header,
                "HTTP/1.1 201 Created\r\n"
                "Content-Length: 5\r\n"
                "\r\n");

            // header then body, unchanged
            BOOST_TEST_EQ(c.stream().output(),
                std::string(req.buffer()) + "a=b&c");
        }
    }

    void
    testEofBody()
    {
        client<test::sync_stream> c(
            "HTTP/1.1 200 OK\r\n"
            "\r\n"
            "until the end");
        auto const res = c.send(make_request(), "a=b&c");
        BOOST_TEST_EQ(res.status_int, 200);
        BOOST_TEST_EQ(res.body, "until the end");
    }

    void
    testLargeBody()
    {
        // larger than any buffer the parser keeps internally
        std::string body(1024 * 1024, '\0');
        for(std::size_t i = 0; i < body.size(); ++i)
            body[i] = static_cast<char>('a' + i % 26);
        std::string const msg =
            "HTTP/1.1 200 OK\r\n"
            "Content-Length: " + std::to_string(body.size()) + "\r\n"
            "\r\n" + body;

        for(std::size_t n : { std::size_t(1), std::size_t(-1) })
        {
            client<test::sync_stream> c(msg);
            c.stream().read_size(n);
            system::error_code ec;
            auto const res = c.send(make_request(), "a=b&c", ec);
            BOOST_TEST(! ec.failed());
            BOOST_TEST_EQ(res.status_int, 200);
            BOOST_TEST_EQ(res.body.size(), body.size());
            BOOST_TEST(res.body == body);
        }

        // the same body without a Content-Length
        {
            client<test::sync_stream> c(
                "HTTP/1.1 200 OK\r\n"
                "\r\n" + body);
            auto const res = c.send(make_request(), "a=b&c");
            BOOST_TEST(res.body == body);
        }
    }

    void
    testErrorStatus()
    {
        // any status is a successful exchange
        client<test::sync_stream> c(
            "HTTP/1.1 500 Internal Server Error\r\n"
            "Content-Length: 0\r\n"
            "\r\n");
        system::error_code ec;
        auto const res = c.send(make_request(), "a=b&c", ec);
        BOOST_TEST(! ec.failed());
        BOOST_TEST_EQ(res.status_int, 500);
        BOOST_TEST(res.body.empty());
    }

    void
    testWriteFailure()
    {
        test::fail_count fc(1);
        client<test::sync_stream> c("", &fc);
        system::error_code ec;
        c.send(make_request(), "a=b&c", ec);
        BOOST_TEST(ec == test::error::test_failure);
        BOOST_TEST(c.stream().output().empty());

        test::fail_count fc2(1);
        client<test::sync_stream> c2("", &fc2);
        BOOST_TEST_THROWS(
            c2.send(make_request(), "a=b&c"),
            system::system_error);
    }

    void
    testReadFailure()
    {
        // the write succeeds, the first read fails
        test::fail_count fc(2);
        client<test::sync_stream> c(
            "HTTP/1.1 200 OK\r\n"
            "Content-Length: 0\r\n"
            "\r\n", &fc);
        system::error_code ec;
        c.send(make_request(), "a=b&c", ec);
        BOOST_TEST(ec == test::error::test_failure);

        // truncated response
        client<test::sync_stream> c2(
            "HTTP/1.1 200 OK\r\n"
            "Content-Length: 10\r\n"
            "\r\n"
            "short");
        c2.send(make_request(), "a=b&c", ec);
        BOOST_TEST(ec.failed());
    }

    void
    testBodyLimit()
    {
        client<test::sync_stream> c(
            "HTTP/1.1 200 OK\r\n"
            "Content-Length: 5\r\n"
            "\r\n"
            "hello");
        BOOST_TEST_EQ(c.params().body_limit,
            std::uint64_t(64 * 1024 * 1024));
        client_params cp;
        cp.body_limit = 2;
        c.set_params(cp);
        system::error_code ec;
        c.send(make_request(), "a=b&c", ec);
        BOOST_TEST(ec == http_proto::error::body_too_large);
    }

    void
    run()
    {
        testSend();
        testEofBody();
        testLargeBody();
        testErrorStatus();
        testWriteFailure();
        testReadFailure();
        testBodyLimit();
    }
};

} // formdata
} // boost

int
main()
{
    boost::formdata::client_test().run();
    return boost::report_errors();
}
