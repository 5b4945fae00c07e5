#include "cmdreg/util/Logger.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace cmdreg::util;

// Redirects the process logger to a temp file for the lifetime of the test
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "cmdreg_logger_test_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".log";
        std::remove(path_.c_str());
        logger().setFile(path_);
        logger().setLevel(LogLevel::Trace);
        logger().setFormatJson(false);
    }

    void TearDown() override {
        logger().setFile("");
        logger().setLevel(LogLevel::Info);
        logger().setFormatJson(false);
        std::remove(path_.c_str());
    }

    std::string contents() const {
        std::ifstream in(path_);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string path_;
};

TEST_F(LoggerTest, TextLineCarriesLevelMessageAndFields) {
    logger().log(LogLevel::Info, "Added command", { {"table", "t"}, {"path", "mod ban"} });
    const auto out = contents();
    EXPECT_NE(out.find("INFO  Added command"), std::string::npos);
    EXPECT_NE(out.find(" table=t"), std::string::npos);
    EXPECT_NE(out.find(" path=mod ban"), std::string::npos);
    EXPECT_EQ(out.back(), '\n');
}

TEST_F(LoggerTest, BelowThresholdIsDropped) {
    logger().setLevel(LogLevel::Warn);
    logger().log(LogLevel::Info, "quiet");
    logger().log(LogLevel::Error, "loud");
    const auto out = contents();
    EXPECT_EQ(out.find("quiet"), std::string::npos);
    EXPECT_NE(out.find("ERROR loud"), std::string::npos);
}

TEST_F(LoggerTest, JsonFormatEscapesQuotes) {
    logger().setFormatJson(true);
    logger().log(LogLevel::Warn, "say \"hi\"", { {"name", "a\"b"} });
    const auto out = contents();
    EXPECT_NE(out.find("\"lvl\":\"WARN\""), std::string::npos);
    EXPECT_NE(out.find("\"msg\":\"say \\\"hi\\\"\""), std::string::npos);
    EXPECT_NE(out.find("\"name\":\"a\\\"b\""), std::string::npos);
}

TEST_F(LoggerTest, ScopedFieldsApplyOnlyInsideScope) {
    {
        Logger::Scoped scope(std::vector<Field>{ {"request", "42"} });
        logger().log(LogLevel::Info, "inside");
    }
    logger().log(LogLevel::Info, "outside");

    const auto out = contents();
    auto inside = out.find("inside");
    auto outside = out.find("outside");
    ASSERT_NE(inside, std::string::npos);
    ASSERT_NE(outside, std::string::npos);
    EXPECT_NE(out.find("request=42"), std::string::npos);
    EXPECT_EQ(out.find("request=42", outside), std::string::npos);
}

TEST_F(LoggerTest, NestedScopeRestoresOuterValue) {
    Logger::Scoped outer(std::vector<Field>{ {"k", "outer"} });
    {
        Logger::Scoped inner(std::vector<Field>{ {"k", "inner"} });
        logger().log(LogLevel::Info, "one");
    }
    logger().log(LogLevel::Info, "two");

    const auto out = contents();
    auto two = out.find("two");
    ASSERT_NE(two, std::string::npos);
    EXPECT_NE(out.find("k=inner"), std::string::npos);
    EXPECT_NE(out.find("k=outer", two), std::string::npos);
}

TEST(LogLevelTest, ParseLevel) {
    EXPECT_EQ(parseLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLevel("Debug"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("WARN"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLevel("bogus"), LogLevel::Info);
    EXPECT_STREQ(levelName(LogLevel::Debug), "DEBUG");
}
