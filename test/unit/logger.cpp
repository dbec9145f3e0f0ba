//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathway/logger.hpp>

#include <boost/core/lightweight_test.hpp>
#include <sstream>
#include <string>

namespace pathway {

struct logger_test
{
    void
    testDisabled()
    {
        section s;
        BOOST_TEST_EQ(s.threshold(), section::disabled);
        BOOST_TEST(s.name().empty());
        s.set_threshold(0);
        BOOST_TEST_EQ(s.threshold(), section::disabled);

        // no effect
        s("x {}", 1);
        LOG_ERR(s)("y");
    }

    void
    testFormat()
    {
        std::stringstream ss;
        log_sections ls(ss);
        auto s = ls.get("route");
        BOOST_TEST_EQ(s.name(), "route");
        BOOST_TEST_EQ(s.threshold(),
            log_sections::default_threshold);

        s("plain");
        s("{} + {} = {}", 1, 2, 3);
        s("trailing {} text", "the");
        s("more {} than {}", "placeholders");
        s("{} {}", std::string("a"), 'b');
        BOOST_TEST_EQ(ss.str(),
            "route plain\n"
            "route 1 + 2 = 3\n"
            "route trailing the text\n"
            "route more placeholders than \n"
            "route a b\n");
    }

    void
    testLevels()
    {
        std::stringstream ss;
        log_sections ls(ss);
        auto s = ls.get("table");

        int n = 0;
        auto count = [&n]{ return ++n; };

        // default threshold is info
        LOG_TRC(s)("trace {}", count());
        LOG_DBG(s)("debug {}", count());
        LOG_INF(s)("info {}", count());
        LOG_WRN(s)("warn {}", count());
        LOG_ERR(s)("error {}", count());

        // squelched records are not formatted
        BOOST_TEST_EQ(n, 3);
        BOOST_TEST_EQ(ss.str(),
            "table info 1\n"
            "table warn 2\n"
            "table error 3\n");

        ss.str("");
        s.set_threshold(0);
        LOG_TRC(s)("trace");
        BOOST_TEST_EQ(ss.str(), "table trace\n");
    }

    void
    testSharing()
    {
        std::stringstream ss;
        log_sections ls(ss);
        auto s0 = ls.get("a");
        auto s1 = ls.get("a");
        auto s2 = ls.get("A");
        s0.set_threshold(4);
        BOOST_TEST_EQ(s1.threshold(), 4);
        BOOST_TEST_EQ(s2.threshold(),
            log_sections::default_threshold);

        LOG_WRN(s1)("hidden");
        LOG_WRN(s2)("shown");
        BOOST_TEST_EQ(ss.str(), "A shown\n");
    }

    void
    run()
    {
        testDisabled();
        testFormat();
        testLevels();
        testSharing();
    }
};

} // pathway

int
main()
{
    pathway::logger_test{}.run();
    return boost::report_errors();
}
