//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_FORMAT_HPP
#define BOOST_FORMDATA_FORMAT_HPP

#include <boost/formdata/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <ostream>
#include <streambuf>
#include <string>

namespace boost {
namespace formdata {

namespace detail {

// Writes the format string to `os`, replacing each
// "{}" with the next argument. Surplus placeholders
// are dropped, surplus arguments are ignored.
class format_impl
{
    std::ostream& os_;
    char const* p_;
    char const* p0_;
    char const* end_;

    // Return the literal text up to the next
    // placeholder, or to the end of the string.
    core::string_view
    next(bool& has_placeholder) noexcept
    {
        has_placeholder = false;
        while(p_ != end_)
        {
            if(*p_++ != '{')
                continue;
            if(p_ == end_)
                break;
            if(*p_ == '{')
            {
                // "{{" is a literal brace
                core::string_view seg(p0_, p_ - p0_);
                p0_ = ++p_;
                return seg;
            }
            if(*p_ == '}')
            {
                core::string_view seg(p0_, (p_ - 1) - p0_);
                p0_ = ++p_;
                has_placeholder = true;
                return seg;
            }
        }
        core::string_view seg(p0_, end_ - p0_);
        p0_ = end_;
        return seg;
    }

    void
    put(core::string_view s)
    {
        // "}}" is a literal brace
        auto p = s.data();
        auto const end = p + s.size();
        auto p0 = p;
        while(p != end)
        {
            if(*p++ != '}' || p == end || *p != '}')
                continue;
            os_.write(p0, static_cast<
                std::streamsize>(p - p0));
            p0 = ++p;
        }
        os_.write(p0, static_cast<
            std::streamsize>(end - p0));
    }

    template<class Arg>
    void
    do_arg(Arg const& arg)
    {
        bool has_placeholder;
        for(;;)
        {
            put(next(has_placeholder));
            if(has_placeholder || p0_ == end_)
                break;
        }
        if(has_placeholder)
            os_ << arg;
    }

public:
    format_impl(
        std::ostream& os,
        core::string_view fs) noexcept
        : os_(os)
        , p_(fs.data())
        , p0_(p_)
        , end_(p_ + fs.size())
    {
    }

    template<class... Args>
    void
    operator()(Args const&... args)
    {
        using expander = int[];
        (void)expander{0, (do_arg(args), 0)...};
        bool has_placeholder;
        while(p0_ != end_)
            put(next(has_placeholder));
    }
};

class appendbuf : public std::streambuf
{
    std::string* s_;

protected:
    int_type overflow(int_type ch) override
    {
        if(ch != traits_type::eof())
        {
            s_->push_back(static_cast<char>(ch));
            return ch;
        }
        return traits_type::eof();
    }

    std::streamsize xsputn(char const* s, std::streamsize n) override
    {
        s_->append(s, static_cast<std::size_t>(n));
        return n;
    }

public:
    explicit appendbuf(std::string& s) noexcept
        : s_(&s)
    {
    }
};

class appendstream : public std::ostream
{
    appendbuf buf_;

public:
    explicit appendstream(std::string& s)
        : std::ostream(&buf_)
        , buf_(s)
    {
    }
};

} // detail

/** Format arguments using a format string

    Each `{}` in the format string is replaced with
    the next argument, written with `operator<<`.
    `{{` and `}}` produce literal braces.
*/
template<class... Args>
void
format_to(
    std::ostream& os,
    core::string_view fs,
    Args const&... args)
{
    detail::format_impl(os, fs)(args...);
}

/** Format arguments using a format string, appending to a string
*/
template<class... Args>
void
format_to(
    std::string& dest,
    core::string_view fs,
    Args const&... args)
{
    detail::appendstream ss(dest);
    format_to(ss, fs, args...);
}

/** Return a string formatted from arguments
*/
template<class... Args>
std::string
format(
    core::string_view fs,
    Args const&... args)
{
    std::string s;
    format_to(s, fs, args...);
    return s;
}

} // formdata
} // boost

#endif
