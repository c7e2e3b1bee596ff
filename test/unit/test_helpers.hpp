//
// Copyright (c) 2016-2019 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_TEST_TEST_HELPERS_HPP
#define BOOST_FORMDATA_TEST_TEST_HELPERS_HPP

#include <boost/formdata/random_source.hpp>
#include <boost/formdata/test/fail_count.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/buffers/copy.hpp>
#include <boost/buffers/buffer.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/core/lightweight_test.hpp>
#include <boost/http_proto/sink.hpp>
#include <boost/http_proto/source.hpp>
#include <cstdio>
#include <fstream>
#include <string>

namespace boost {
namespace formdata {
namespace test {

/** A random source which repeats a fixed sequence

    Two instances constructed with the same seed
    produce the same values.
*/
class counting_random_source
    : public random_source
{
    result_type v_;

public:
    explicit
    counting_random_source(result_type seed = 0) noexcept
        : v_(seed)
    {
    }

protected:
    result_type
    next() override
    {
        // LCG constants from Numerical Recipes
        v_ = v_ * 1664525u + 1013904223u;
        return v_;
    }
};

/** A source which yields a string, optionally failing
*/
class string_source
    : public http_proto::source
{
    core::string_view s_;
    std::size_t nread_ = 0;
    std::size_t read_max_;
    fail_count* fc_;

public:
    explicit
    string_source(
        core::string_view s,
        std::size_t read_max = std::size_t(-1),
        fail_count* fc = nullptr) noexcept
        : s_(s)
        , read_max_(read_max)
        , fc_(fc)
    {
    }

protected:
    results
    on_read(buffers::mutable_buffer b) override
    {
        results rs;
        if(fc_ && fc_->fail(rs.ec))
            return rs;
        auto const n = buffers::copy(
            b,
            buffers::const_buffer(
                s_.data() + nread_,
                s_.size() - nread_),
            read_max_);
        nread_ += n;
        rs.bytes = n;
        rs.finished = nread_ >= s_.size();
        return rs;
    }
};

/** A sink which appends to a string, optionally failing
*/
class failing_sink
    : public http_proto::sink
{
    fail_count& fc_;
    std::string s_;

public:
    explicit
    failing_sink(fail_count& fc) noexcept
        : fc_(fc)
    {
    }

    std::string const&
    str() const noexcept
    {
        return s_;
    }

protected:
    results
    on_write(
        buffers::const_buffer b,
        bool) override
    {
        results rs;
        if(fc_.fail(rs.ec))
            return rs;
        s_.append(
            static_cast<char const*>(b.data()),
            b.size());
        rs.bytes = b.size();
        return rs;
    }
};

/** A blocking stream for testing clients

    Reads return the canned input, then end of file.
    Writes are appended to the output.
*/
class sync_stream
{
    std::string in_;
    std::size_t pos_ = 0;
    std::size_t read_max_ = std::size_t(-1);
    std::string out_;
    fail_count* fc_ = nullptr;

public:
    explicit
    sync_stream(
        core::string_view in = {},
        fail_count* fc = nullptr)
        : in_(in.data(), in.size())
        , fc_(fc)
    {
    }

    /// Limit the number of bytes returned by each read
    void
    read_size(std::size_t n) noexcept
    {
        read_max_ = n;
    }

    std::string const&
    output() const noexcept
    {
        return out_;
    }

    template<class MutableBufferSequence>
    std::size_t
    read_some(
        MutableBufferSequence const& dest,
        system::error_code& ec)
    {
        if(fc_ && fc_->fail(ec))
            return 0;
        if(pos_ >= in_.size())
        {
            ec = asio::error::eof;
            return 0;
        }
        auto const n = buffers::copy(
            dest,
            buffers::const_buffer(
                in_.data() + pos_,
                in_.size() - pos_),
            read_max_);
        pos_ += n;
        return n;
    }

    template<class ConstBufferSequence>
    std::size_t
    write_some(
        ConstBufferSequence const& src,
        system::error_code& ec)
    {
        if(fc_ && fc_->fail(ec))
            return 0;
        std::size_t n = 0;
        auto it = asio::buffer_sequence_begin(src);
        auto const end = asio::buffer_sequence_end(src);
        for(; it != end; ++it)
        {
            asio::const_buffer const cb(*it);
            out_.append(
                static_cast<char const*>(cb.data()),
                cb.size());
            n += cb.size();
        }
        return n;
    }
};

/** A file removed when the object is destroyed
*/
class temp_file
{
    std::string path_;

public:
    temp_file(
        core::string_view name,
        core::string_view content)
        : path_(name.data(), name.size())
    {
        std::ofstream f(path_, std::ios::binary);
        f.write(content.data(), static_cast<
            std::streamsize>(content.size()));
    }

    temp_file(temp_file const&) = delete;
    temp_file& operator=(temp_file const&) = delete;

    ~temp_file()
    {
        std::remove(path_.c_str());
    }

    std::string const&
    path() const noexcept
    {
        return path_;
    }
};

/// Return the number of times `what` occurs in `s`
inline
std::size_t
count(
    core::string_view s,
    core::string_view what)
{
    std::size_t n = 0;
    auto pos = s.find(what);
    while(pos != core::string_view::npos)
    {
        ++n;
        pos = s.find(what, pos + what.size());
    }
    return n;
}

} // test
} // formdata
} // boost

#endif
