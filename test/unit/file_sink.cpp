//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/formdata/file_sink.hpp>

#include <boost/formdata/multipart_writer.hpp>
#include <boost/formdata/string_sink.hpp>
#include <boost/system/system_error.hpp>
#include <fstream>
#include <iterator>

#include "test_helpers.hpp"

namespace boost {
namespace formdata {

struct file_sink_test
{
    static
    std::string
    read_file(char const* path)
    {
        std::ifstream f(path, std::ios::binary);
        return std::string(
            std::istreambuf_iterator<char>(f),
            std::istreambuf_iterator<char>());
    }

    void
    testWriteBody()
    {
        // same body through a file and through memory
        test::temp_file out("formdata_file_sink_out.bin", "stale");

        test::counting_random_source r1(3);
        string_sink mem;
        {
            multipart_writer w(mem, r1);
            w.text("a", "1");
            test::string_source src(
                core::string_view("binary\0data", 11), 4);
            w.stream(src, "b", core::string_view("b.bin"), boost::none);
            w.finish();
        }

        test::counting_random_source r2(3);
        file_sink fs(out.path().c_str());
        {
            multipart_writer w(fs, r2);
            w.text("a", "1");
            test::string_source src(
                core::string_view("binary\0data", 11), 4);
            w.stream(src, "b", core::string_view("b.bin"), boost::none);
            w.finish();
        }
        BOOST_TEST_EQ(fs.size(), mem.str().size());
        system::error_code ec;
        fs.close(ec);
        BOOST_TEST(! ec.failed());

        // the file was truncated on open
        BOOST_TEST_EQ(read_file(out.path().c_str()), mem.str());
    }

    void
    testOpenFailure()
    {
        BOOST_TEST_THROWS(
            file_sink("formdata_no_such_dir/out.bin"),
            system::system_error);
    }

    void
    run()
    {
        testWriteBody();
        testOpenFailure();
    }
};

} // formdata
} // boost

int
main()
{
    boost::formdata::file_sink_test().run();
    return boost::report_errors();
}
