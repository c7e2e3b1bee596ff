//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_FORMDATA_LOGGER_HPP
#define BOOST_FORMDATA_LOGGER_HPP

#include <boost/formdata/detail/config.hpp>
#include <boost/formdata/format.hpp>
#include <boost/core/detail/string_view.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace boost {
namespace formdata {

/// Severity levels understood by @ref section
enum class log_level : int
{
    trace = 0,
    debug,
    info,
    warning,
    error,
    fatal,
    off
};

/** A named log section

    Sections are cheap handles which share state;
    copies refer to the same name and threshold.
    The threshold may be changed while other
    threads are logging.
    Messages below the threshold are discarded by
    the `LOG_*` macros before any formatting work
    is done.
*/
struct section
{
    BOOST_FORMDATA_DECL
    section() noexcept;

    /** Return the level below which logging is squelched
    */
    int threshold() const noexcept
    {
        return impl_ ? impl_->level.load(
            std::memory_order_relaxed) :
                static_cast<int>(log_level::off);
    }

    /** Set the level below which logging is squelched
    */
    void set_threshold(log_level level) noexcept
    {
        if(impl_)
            impl_->level.store(
                static_cast<int>(level),
                std::memory_order_relaxed);
    }

    /** Return the name of the section
    */
    core::string_view name() const noexcept
    {
        if(! impl_)
            return {};
        return impl_->name;
    }

    template<class... Args>
    void operator()(
        core::string_view const& fs,
        Args const&... args)
    {
        if(! impl_)
            return;
        std::string s = impl_->name;
        s.push_back(' ');
        format_to(s, fs, args...);
        write(s);
    }

private:
    BOOST_FORMDATA_DECL
    void write(core::string_view);

    section(core::string_view);

    friend class log_sections;

    struct impl
    {
        std::string name;
        std::atomic<int> level{
            static_cast<int>(log_level::warning)};
    };

    std::shared_ptr<impl> impl_;
};

//------------------------------------------------

class log_sections
{
public:
    /** Destructor
    */
    BOOST_FORMDATA_DECL
    ~log_sections();

    /** Constructor
    */
    BOOST_FORMDATA_DECL
    log_sections();

    log_sections(log_sections const&) = delete;
    log_sections& operator=(log_sections const&) = delete;

    /** Return a log section by name.

        If the section does not already exist, it is created.
        The name is case sensitive.
    */
    BOOST_FORMDATA_DECL
    section
    get(core::string_view name);

    /** Return all sections created so far
    */
    BOOST_FORMDATA_DECL
    std::vector<section>
    get_sections() const;

    /** Set the threshold of every section

        Sections created later start at this level.
    */
    BOOST_FORMDATA_DECL
    void
    set_threshold(log_level level);

private:
    struct impl;
    impl* impl_;
};

/** Return the log sections used by this library
*/
BOOST_FORMDATA_DECL
log_sections&
default_log_sections();

//------------------------------------------------

#ifndef LOG_AT_LEVEL
#define LOG_AT_LEVEL(sect, level) \
    if((level) < (sect).threshold()) {} else sect
#endif

/// Log at trace level
#ifndef LOG_TRC
#define LOG_TRC(sect) LOG_AT_LEVEL(sect, 0)
#endif

/// Log at debug level
#ifndef LOG_DBG
#define LOG_DBG(sect) LOG_AT_LEVEL(sect, 1)
#endif

/// Log at info level (normal)
#ifndef LOG_INF
#define LOG_INF(sect) LOG_AT_LEVEL(sect, 2)
#endif

/// Log at warning level
#ifndef LOG_WRN
#define LOG_WRN(sect) LOG_AT_LEVEL(sect, 3)
#endif

/// Log at error level
#ifndef LOG_ERR
#define LOG_ERR(sect) LOG_AT_LEVEL(sect, 4)
#endif

} // formdata
} // boost

#endif
