//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/formdata/format.hpp>

#include <sstream>

#include "test_helpers.hpp"

namespace boost {
namespace formdata {

struct format_test
{
    template<class... Args>
    void f(
        core::string_view match,
        core::string_view fs,
        Args const&... args)
    {
        std::string s;
        format_to(s, fs, args...);
        BOOST_TEST_EQ(s, match);
        BOOST_TEST_EQ(format(fs, args...), match);

        std::stringstream ss;
        format_to(ss, fs, args...);
        BOOST_TEST_EQ(ss.str(), match);
    }

    void run()
    {
        // No arguments
        f("",       "");
        f("x",      "x");
        f("{",      "{{");
        f("}",      "}}");
        f("}{",     "}}{{");

        // String arguments
        f("x",      "{}",     "x");
        f("{",      "{{",     "x");
        f("}",      "}}",     "x");
        f("}{",     "}}{{",   "x");
        f("1a2b3",  "1{}2{}3", "a", "b");
        f("1a2b3",  "1{}2{}3", "a", "b", "c");
        f("hello world!", "hello {}!", "world");
        f("hello world! {} ", "hello {}! {{}} ", "world");

        // Missing arguments drop the placeholder
        f("12",     "1{}2");
        f("1a23",   "1{}2{}3", "a");

        // Other argument types
        f("x",      "{}",     'x');
        f("n=42",   "n={}",   42);
        f("--b--",  "--{}--", std::string("b"));
        f("name=\"v\"", "name=\"{}\"", core::string_view("v"));
    }
};

} // formdata
} // boost

int
main()
{
    boost::formdata::format_test().run();
    return boost::report_errors();
}
