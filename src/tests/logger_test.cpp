#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace netcp::logger;
using netcp::test::TempDirectory;

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        netcp::test::init_test_logging();
    }

    std::string read_log() {
        boost::log::core::get()->flush();
        std::ifstream file(log_path(), std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    std::filesystem::path log_path() const { return dir.path() / "netcp.log"; }

    TempDirectory dir{"netcp_logger_test"};
};

TEST_F(LoggerTest, FileSinkWritesRecordsAtOrAboveLevel) {
    LogOptions options;
    options.log_file = log_path().string();
    options.min_level = boost::log::trivial::info;
    init_logging(options);

    BOOST_LOG_TRIVIAL(debug) << "Test: filtered out";
    BOOST_LOG_TRIVIAL(info) << "Test: session started";
    BOOST_LOG_TRIVIAL(error) << "Test: session failed";

    std::string log = read_log();
    EXPECT_EQ(log.find("filtered out"), std::string::npos);
    EXPECT_NE(log.find("[info] Test: session started"), std::string::npos);
    EXPECT_NE(log.find("[error] Test: session failed"), std::string::npos);
}

TEST_F(LoggerTest, FileSinkAppends) {
    LogOptions options;
    options.log_file = log_path().string();
    options.min_level = boost::log::trivial::trace;

    init_logging(options);
    BOOST_LOG_TRIVIAL(info) << "Test: first run";
    boost::log::core::get()->flush();

    init_logging(options);
    BOOST_LOG_TRIVIAL(info) << "Test: second run";

    std::string log = read_log();
    EXPECT_NE(log.find("first run"), std::string::npos);
    EXPECT_NE(log.find("second run"), std::string::npos);
}

TEST_F(LoggerTest, DefaultLevelOnlyPassesFatal) {
    LogOptions options;
    EXPECT_EQ(options.min_level, boost::log::trivial::fatal);

    options.log_file = log_path().string();
    init_logging(options);

    BOOST_LOG_TRIVIAL(error) << "Test: hidden by default";
    BOOST_LOG_TRIVIAL(fatal) << "Test: always shown";

    std::string log = read_log();
    EXPECT_EQ(log.find("hidden by default"), std::string::npos);
    EXPECT_NE(log.find("always shown"), std::string::npos);
}

TEST_F(LoggerTest, ParseSeverity) {
    EXPECT_EQ(parse_severity("trace"), boost::log::trivial::trace);
    EXPECT_EQ(parse_severity("debug"), boost::log::trivial::debug);
    EXPECT_EQ(parse_severity("warning"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_THROW(parse_severity("verbose"), std::invalid_argument);
    EXPECT_THROW(parse_severity(""), std::invalid_argument);
}
