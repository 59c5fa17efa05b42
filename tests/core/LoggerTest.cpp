#include "sea/Json.hpp"
#include "sea/util/Config.hpp"
#include "sea/util/Logger.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace sea;
using namespace sea::util;

namespace {

// Points the process logger at a scratch file for one test and restores
// stdout / Info / text afterwards.
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = (std::filesystem::temp_directory_path() / ("sea_log_" + std::to_string(stamp) + ".log")).string();
        logger().setFile(path);
        logger().setLevel(LogLevel::Trace);
        logger().setFormatJson(false);
    }

    void TearDown() override {
        logger().setFile("");
        logger().setLevel(LogLevel::Info);
        logger().setFormatJson(false);
        std::remove(path.c_str());
    }

    std::vector<std::string> lines() const {
        std::ifstream in(path);
        std::vector<std::string> out;
        std::string line;
        while (std::getline(in, line)) out.push_back(line);
        return out;
    }

    std::string path;
};

} // namespace

TEST_F(LoggerTest, WritesTextLineWithFields) {
    logger().log(LogLevel::Info, "Store created", { {"store", "counter"} });

    auto out = lines();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_NE(out[0].find("INFO"), std::string::npos);
    EXPECT_NE(out[0].find("Store created"), std::string::npos);
    EXPECT_NE(out[0].find("store=counter"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowLevel) {
    logger().setLevel(LogLevel::Warn);
    logger().log(LogLevel::Debug, "hidden");
    logger().log(LogLevel::Info, "hidden too");
    logger().log(LogLevel::Error, "shown");

    auto out = lines();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_NE(out[0].find("shown"), std::string::npos);
    EXPECT_FALSE(logger().enabled(LogLevel::Info));
    EXPECT_TRUE(logger().enabled(LogLevel::Warn));
}

TEST_F(LoggerTest, JsonLinesAreParseable) {
    logger().setFormatJson(true);
    logger().log(LogLevel::Warn, "quote \" inside", { {"k", "v"} });

    auto out = lines();
    ASSERT_EQ(out.size(), 1u);
    auto parsed = json::parse(out[0]);
    ASSERT_TRUE(parsed) << out[0];
    EXPECT_STREQ((*parsed)["lvl"].GetString(), "WARN");
    EXPECT_STREQ((*parsed)["msg"].GetString(), "quote \" inside");
    EXPECT_STREQ((*parsed)["k"].GetString(), "v");
    EXPECT_TRUE((*parsed).HasMember("ts"));
}

TEST_F(LoggerTest, ScopedContextIsAppendedAndRestored) {
    {
        Logger::Scoped outer({ {"store", "a"} });
        {
            Logger::Scoped inner({ {"store", "b"}, {"action", "inc"} });
            logger().log(LogLevel::Info, "inner");
        }
        logger().log(LogLevel::Info, "outer");
    }
    logger().log(LogLevel::Info, "none");

    auto out = lines();
    ASSERT_EQ(out.size(), 3u);
    EXPECT_NE(out[0].find("store=b"), std::string::npos);
    EXPECT_NE(out[0].find("action=inc"), std::string::npos);
    EXPECT_NE(out[1].find("store=a"), std::string::npos);
    EXPECT_EQ(out[1].find("action="), std::string::npos);
    EXPECT_EQ(out[2].find("store="), std::string::npos);
}

TEST_F(LoggerTest, ExplicitFieldOverridesScopedKey) {
    logger().setFormatJson(true);
    Logger::Scoped scope({ {"store", "outer"}, {"action", "inc"} });
    logger().log(LogLevel::Info, "tagged", { {"store", "inner"} });

    auto out = lines();
    ASSERT_EQ(out.size(), 1u);
    auto parsed = json::parse(out[0]);
    ASSERT_TRUE(parsed) << out[0];
    int storeKeys = 0;
    for (auto& m : (*parsed).GetObject()) {
        if (std::string(m.name.GetString()) == "store") ++storeKeys;
    }
    EXPECT_EQ(storeKeys, 1);
    EXPECT_STREQ((*parsed)["store"].GetString(), "inner");
    EXPECT_STREQ((*parsed)["action"].GetString(), "inc");
}

TEST_F(LoggerTest, ExplicitFieldOverridesScopedKeyInText) {
    Logger::Scoped scope({ {"store", "outer"} });
    logger().log(LogLevel::Info, "tagged", { {"store", "inner"} });

    auto out = lines();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].find("store=outer"), std::string::npos);
    EXPECT_NE(out[0].find("store=inner"), std::string::npos);
}

TEST_F(LoggerTest, ConfigureLoggingAppliesKnobs) {
    Config cfg;
    cfg.logLevel = "error";
    cfg.logJson = true;
    cfg.logFile = path;
    configureLogging(cfg);

    EXPECT_EQ(logger().level(), LogLevel::Error);
    logger().log(LogLevel::Error, "boom");
    auto out = lines();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].front(), '{');
}

TEST(LogLevelTest, ParseAndPrint) {
    EXPECT_EQ(parseLevel("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parseLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("bogus"), LogLevel::Info);
    EXPECT_STREQ(toString(LogLevel::Debug), "DEBUG");
}
