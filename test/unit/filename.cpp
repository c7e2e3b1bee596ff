//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/formdata/filename.hpp>

#include "test_helpers.hpp"

namespace boost {
namespace formdata {

struct filename_test
{
    void
    ok(
        core::string_view path,
        core::string_view expected)
    {
        auto const rs = filename(path);
        if(! BOOST_TEST(rs.has_value()))
            return;
        BOOST_TEST_EQ(*rs, expected);
    }

    void
    none(core::string_view path)
    {
        BOOST_TEST(! filename(path).has_value());
    }

    void
    run()
    {
        ok("sample.txt", "sample.txt");
        ok("dir/sample.txt", "sample.txt");
        ok("/abs/dir/sample.txt", "sample.txt");
        ok("dir/sub/", "sub");
        ok("dir/sub//", "sub");
        ok("dir/.", "dir");
        ok(".hidden", ".hidden");

        none("");
        none("/");
        none("///");
        none("..");
        none("dir/..");
        none(".");

        // backslash separates components only on Windows
    #ifdef _WIN32
        ok("C:\\Users\\me\\doc.pdf", "doc.pdf");
        ok("dir\\sub\\", "sub");
        none("dir\\..");
    #else
        ok("a\\b.txt", "a\\b.txt");
        ok("dir/a\\b.txt", "a\\b.txt");
        ok("dir\\", "dir\\");
    #endif
    }
};

} // formdata
} // boost

int
main()
{
    boost::formdata::filename_test().run();
    return boost::report_errors();
}
