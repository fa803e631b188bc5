#define BOOST_TEST_MODULE logger_tester
#include <boost/test/included/unit_test.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "namespaces.h"
#include "logger.h"

BOOST_AUTO_TEST_SUITE(logger_tester)

using namespace std;
using namespace httpsig;


BOOST_AUTO_TEST_CASE(test_log_levels)
{
    Logger log(SILLY);                // All logs with level >= SILLY will display

    // You can call log with a level manually
    log.log(INFO, "This is the first info log");
    log.log(SILLY, "This is the first silly log");

    // Or you can use a convenience method, named after the log level
    log.warn("This is the first warning");
    log.error("This is the first error");

    // Or you can use macros for efficiency
    LOG_DEBUG("This is a macro DEBUG LOG");
    LOG_ERROR("This is a macro ERROR LOG");

    // Now we will only see logs with a level >= VERBOSE
    log.set_threshold(VERBOSE);
    BOOST_CHECK(log.would_log(VERBOSE));
    BOOST_CHECK(log.would_log(WARN));
    BOOST_CHECK(!log.would_log(DEBUG));
    BOOST_CHECK(!log.would_log(SILLY));

    auto saved = logger.get_threshold();
    logger.set_threshold(VERBOSE);
    LOG_VERBOSE("This should make it out from the default logger with the macro");
    LOG_WARN("This should make it out with from the default logger the macro");
    LOG_DEBUG("This should not make it out from the default logger with the macro");
    logger.set_threshold(saved);
}

BOOST_AUTO_TEST_CASE(test_invalid_threshold)
{
    Logger log(ABORT);  // not a valid initial threshold
    BOOST_CHECK_EQUAL(log.get_threshold(), default_log_level());

    log.set_threshold(static_cast<log_level_t>(42));
    BOOST_CHECK_EQUAL(log.get_threshold(), default_log_level());
}

BOOST_AUTO_TEST_CASE(test_level_from_string)
{
    BOOST_CHECK(log_level_from_string("SILLY") == boost::make_optional(SILLY));
    BOOST_CHECK(log_level_from_string("WARN") == boost::make_optional(WARN));
    BOOST_CHECK(!log_level_from_string("warn"));
    BOOST_CHECK(!log_level_from_string("LOUD"));
    BOOST_CHECK_EQUAL(util::str(ERROR), "ERROR");
}

BOOST_AUTO_TEST_CASE(test_log_to_file)
{
    const string fname = "httpsig-test-logger.log";
    std::remove(fname.c_str());

    Logger log(INFO);
    log.enable_timestamp();
    log.log_to_file(fname);
    BOOST_CHECK_EQUAL(log.current_log_file(), fname);

    log.info("This goes to the file");
    log.debug("This does not");
    log.log_to_file("");
    BOOST_CHECK(log.current_log_file().empty());

    ifstream f(fname);
    BOOST_REQUIRE(f.is_open());
    stringstream ss;
    ss << f.rdbuf();
    auto content = ss.str();
    BOOST_CHECK(content.find("HTTPSIG START") != string::npos);
    BOOST_CHECK(content.find("[INFO] This goes to the file") != string::npos);
    BOOST_CHECK(content.find("This does not") == string::npos);

    std::remove(fname.c_str());
}

BOOST_AUTO_TEST_SUITE_END()
