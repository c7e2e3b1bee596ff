//
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/formdata.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/http_proto/field.hpp>
#include <boost/http_proto/method.hpp>
#include <boost/http_proto/request.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <boost/system/system_error.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace boost;
namespace po = boost::program_options;

namespace {

// One -F argument: name=value or name=@path[;type=..][;filename=..]
struct form_option
{
    std::string name;
    std::string value;
    bool is_file = false;
    optional<std::string> filename;
    optional<std::string> type;
};

form_option
parse_form_option(core::string_view sv)
{
    form_option rs;
    auto const eq = sv.find('=');
    if(eq == core::string_view::npos)
        throw std::runtime_error("Illegally formatted input field");
    rs.name = std::string(sv.substr(0, eq));
    sv.remove_prefix(eq + 1);

    if(sv.empty() || sv.front() != '@')
    {
        rs.value = std::string(sv);
        return rs;
    }

    rs.is_file = true;
    sv.remove_prefix(1);
    auto pos = sv.find(';');
    rs.value = std::string(sv.substr(0, pos));
    while(pos != core::string_view::npos)
    {
        sv.remove_prefix(pos + 1);
        pos = sv.find(';');
        auto const param = sv.substr(0, pos);
        if(param.starts_with("type="))
            rs.type.emplace(param.substr(5));
        else if(param.starts_with("filename="))
            rs.filename.emplace(param.substr(9));
        else
            throw std::runtime_error(
                "Unknown form parameter: " + std::string(param));
    }
    return rs;
}

void
add_field(
    formdata::multipart_form& form,
    form_option const& opt)
{
    if(! opt.is_file)
    {
        form.add_text(opt.name, opt.value);
        return;
    }

    if(! opt.filename && ! opt.type)
    {
        form.add_file(opt.name, opt.value);
        return;
    }

    system::error_code ec;
    formdata::file_source src(opt.value.c_str(), ec);
    if(ec.failed())
        throw formdata::source_error(ec);

    optional<core::string_view> filename;
    if(opt.filename)
        filename = core::string_view(*opt.filename);
    else
        filename = formdata::filename(opt.value);

    core::string_view const type = opt.type
        ? core::string_view(*opt.type)
        : formdata::mime_type(opt.value);

    form.add_stream(src, opt.name, filename, type);
}

} // (anon)

int
main(int argc, char* argv[])
{
    try
    {
        auto odesc = po::options_description{ "Options" };
        odesc.add_options()
            ("help,h", "Show this help")
            ("url",
                po::value<std::string>()->value_name("<url>"),
                "The http URL to upload to")
            ("form,F",
                po::value<std::vector<std::string>>()->value_name("<name=content>"),
                "Add a field, name=@path sends a file")
            ("form-string",
                po::value<std::vector<std::string>>()->value_name("<name=string>"),
                "Add a text field, taken literally")
            ("verbose,v", "Log the exchange to standard error");

        po::positional_options_description pdesc;
        pdesc.add("url", 1);

        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv)
                .options(odesc)
                .positional(pdesc)
                .run(),
            vm);
        po::notify(vm);

        if(vm.count("help") || ! vm.count("url"))
        {
            std::cerr
                << "Usage: upload [options...] <url>\n"
                << odesc;
            return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        if(vm.count("verbose"))
            formdata::default_log_sections().set_threshold(
                formdata::log_level::debug);

        auto const url = urls::parse_uri(
            vm.at("url").as<std::string>()).value();
        if(url.scheme_id() != urls::scheme::http)
            throw std::runtime_error("Only http URLs are supported");

        formdata::multipart_form form;
        if(vm.count("form"))
            for(core::string_view sv :
                vm.at("form").as<std::vector<std::string>>())
                add_field(form, parse_form_option(sv));
        if(vm.count("form-string"))
        {
            for(core::string_view sv :
                vm.at("form-string").as<std::vector<std::string>>())
            {
                auto const pos = sv.find('=');
                if(pos == core::string_view::npos)
                    throw std::runtime_error("Illegally formatted input field");
                form.add_text(sv.substr(0, pos), sv.substr(pos + 1));
            }
        }
        auto const fb = form.finish();

        http_proto::request req;
        req.set_method(http_proto::method::post);
        req.set_target(url.encoded_target().empty()
            ? core::string_view("/")
            : core::string_view(url.encoded_target()));
        req.set(
            http_proto::field::host,
            url.authority().encoded_host_and_port().decode());
        req.set(http_proto::field::user_agent, "Boost.Formdata");
        req.set(http_proto::field::content_type, fb.content_type);
        req.set_content_length(fb.body.size());

        asio::io_context ioc;
        asio::ip::tcp::resolver resolver(ioc);
        formdata::client<asio::ip::tcp::socket> client(ioc);
        asio::connect(
            client.stream(),
            resolver.resolve(
                url.encoded_host().decode(),
                url.has_port() ? std::string(url.port()) : "80"));

        auto const res = client.send(req, fb.body);
        if(vm.count("verbose"))
            std::cerr << res.header;
        std::cout << res.body;
        return res.status_int < 400 ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch(std::exception const& e)
    {
        std::cerr << "upload: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
