//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/formdata/mime_type.hpp>

#include "test_helpers.hpp"

namespace boost {
namespace formdata {

struct mime_type_test
{
    void
    check(
        core::string_view path,
        core::string_view expected)
    {
        BOOST_TEST_EQ(mime_type(path), expected);
    }

    void
    run()
    {
        check("sample.txt", "text/plain");
        check("index.HTML", "text/html");
        check("dir/photo.JpG", "image/jpeg");
        check("a.b.c.png", "image/png");
        check("report.pdf", "application/pdf");
        check("data.json", "application/json");
        check("clip.mp4", "video/mp4");
        check("song.mp3", "audio/mpeg");

        // fallback
        check("archive.unknownext", "application/octet-stream");
        check("Makefile", "application/octet-stream");
        check("", "application/octet-stream");
        check("trailing.", "application/octet-stream");

        // a dot in a directory is not an extension
        check("v1.2/README", "application/octet-stream");
        check("C:\\dir.d\\notes", "application/octet-stream");
    }
};

} // formdata
} // boost

int
main()
{
    boost::formdata::mime_type_test().run();
    return boost::report_errors();
}
