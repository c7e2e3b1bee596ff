//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/formdata/mime_type.hpp>
#include <boost/formdata/filename.hpp>
#include <boost/url/grammar/ci_string.hpp>

namespace boost {
namespace formdata {

namespace {

core::string_view
get_extension(
    core::string_view path) noexcept
{
    auto const sep = path.find_last_of(detail::path_separators);
    if(sep != core::string_view::npos)
        path = path.substr(sep + 1);
    auto const pos = path.rfind(".");
    if(pos == core::string_view::npos)
        return core::string_view();
    return path.substr(pos);
}

} // (anon)

core::string_view
mime_type(core::string_view path) noexcept
{
    using urls::grammar::ci_is_equal;
    auto const ext = get_extension(path);
    if(ext.empty())
        return octet_stream;

    // clang-format off
    if(ci_is_equal(ext, ".txt"))  return "text/plain";
    if(ci_is_equal(ext, ".log"))  return "text/plain";
    if(ci_is_equal(ext, ".md"))   return "text/markdown";
    if(ci_is_equal(ext, ".csv"))  return "text/csv";
    if(ci_is_equal(ext, ".htm"))  return "text/html";
    if(ci_is_equal(ext, ".html")) return "text/html";
    if(ci_is_equal(ext, ".css"))  return "text/css";
    if(ci_is_equal(ext, ".js"))   return "text/javascript";
    if(ci_is_equal(ext, ".mjs"))  return "text/javascript";
    if(ci_is_equal(ext, ".json")) return "application/json";
    if(ci_is_equal(ext, ".xml"))  return "application/xml";
    if(ci_is_equal(ext, ".pdf"))  return "application/pdf";
    if(ci_is_equal(ext, ".zip"))  return "application/zip";
    if(ci_is_equal(ext, ".gz"))   return "application/gzip";
    if(ci_is_equal(ext, ".tar"))  return "application/x-tar";
    if(ci_is_equal(ext, ".7z"))   return "application/x-7z-compressed";
    if(ci_is_equal(ext, ".wasm")) return "application/wasm";
    if(ci_is_equal(ext, ".doc"))  return "application/msword";
    if(ci_is_equal(ext, ".docx")) return "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
    if(ci_is_equal(ext, ".xls"))  return "application/vnd.ms-excel";
    if(ci_is_equal(ext, ".xlsx")) return "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
    if(ci_is_equal(ext, ".png"))  return "image/png";
    if(ci_is_equal(ext, ".jpe"))  return "image/jpeg";
    if(ci_is_equal(ext, ".jpeg")) return "image/jpeg";
    if(ci_is_equal(ext, ".jpg"))  return "image/jpeg";
    if(ci_is_equal(ext, ".gif"))  return "image/gif";
    if(ci_is_equal(ext, ".bmp"))  return "image/bmp";
    if(ci_is_equal(ext, ".webp")) return "image/webp";
    if(ci_is_equal(ext, ".ico"))  return "image/vnd.microsoft.icon";
    if(ci_is_equal(ext, ".tiff")) return "image/tiff";
    if(ci_is_equal(ext, ".tif"))  return "image/tiff";
    if(ci_is_equal(ext, ".svg"))  return "image/svg+xml";
    if(ci_is_equal(ext, ".mp3"))  return "audio/mpeg";
    if(ci_is_equal(ext, ".wav"))  return "audio/wav";
    if(ci_is_equal(ext, ".ogg"))  return "audio/ogg";
    if(ci_is_equal(ext, ".mp4"))  return "video/mp4";
    if(ci_is_equal(ext, ".webm")) return "video/webm";
    if(ci_is_equal(ext, ".avi"))  return "video/x-msvideo";
    // clang-format on

    return octet_stream;
}

} // formdata
} // boost
