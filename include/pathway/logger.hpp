//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_LOGGER_HPP
#define PATHWAY_LOGGER_HPP

#include <pathway/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <iosfwd>
#include <memory>
#include <sstream>
#include <string>

namespace pathway {

class log_sections;

/** A named destination for log records

    Copies of a section refer to the same name and
    threshold. A default constructed section is
    disabled: its threshold is above every level.

    Records are formatted by replacing each `{}` in
    the format string with the next argument, written
    with `operator<<`.
*/
struct section
{
    /// Levels above every valid level
    static constexpr int disabled = 6;

    PATHWAY_DECL
    section() noexcept;

    /** Return the level below which logging is squelched
    */
    PATHWAY_DECL
    int threshold() const noexcept;

    /** Set the level below which logging is squelched

        This affects every copy of the section.
    */
    PATHWAY_DECL
    void set_threshold(int level) noexcept;

    /// Return the name of the section
    PATHWAY_DECL
    core::string_view name() const noexcept;

    void operator()(
        core::string_view const& fs) const
    {
        format_impl(fs, nullptr, nullptr, 0);
    }

    template<class... Args>
    void operator()(
        core::string_view const& fs,
        Args const&... args) const
    {
        auto const N = sizeof...(Args);
        std::size_t len[N];
        std::stringstream ss;
        write(ss, len, args...);
        std::string s(ss.str());
        format_impl(fs, s.data(), len, N);
    }

private:
    template<class T1, class T2, class... TN>
    static void write(
        std::stringstream& ss,
        std::size_t* plen,
        T1 const& t1,
        T2 const& t2,
        TN const&... tn)
    {
        auto const n0 = ss.tellp();
        ss << t1;
        *plen = static_cast<std::size_t>(
            ss.tellp() - n0);
        write(ss, ++plen, t2, tn...);
    }

    template<class T>
    static void write(
        std::stringstream& ss,
        std::size_t* plen,
        T const& t)
    {
        auto const n0 = ss.tellp();
        ss << t;
        *plen = static_cast<std::size_t>(
            ss.tellp() - n0);
    }

    PATHWAY_DECL
    void format_impl(core::string_view,
        char const*, std::size_t*, std::size_t n) const;

    struct impl;

    explicit section(std::shared_ptr<impl>) noexcept;

    friend class log_sections;

    std::shared_ptr<impl> impl_;
};

//------------------------------------------------

/** A collection of log sections sharing one output stream

    Each record is written as one line, prefixed by
    the section name. Writes are serialized.
*/
class log_sections
{
public:
    /// The threshold given to new sections
    static constexpr int default_threshold = 2;

    /** Destructor
    */
    PATHWAY_DECL
    ~log_sections();

    /** Constructor

        Records are written to `std::cerr`.
    */
    PATHWAY_DECL
    log_sections();

    /** Constructor

        Records are written to `os`, which must
        outlive every section obtained from this
        object.
    */
    PATHWAY_DECL
    explicit
    log_sections(std::ostream& os);

    log_sections(log_sections const&) = delete;
    log_sections& operator=(log_sections const&) = delete;

    /** Return a log section by name.

        If the section does not already exist, it is created.
        The name is case sensitive.
    */
    PATHWAY_DECL
    section
    get(core::string_view name);

private:
    struct impl;
    impl* impl_;
};

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

} // pathway

#endif
