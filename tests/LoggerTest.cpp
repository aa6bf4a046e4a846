#include "gbcore/common/Logger.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace gbcore::common {
namespace {

TEST(LoggerTest, WritesOnlyAfterInit) {
    const auto logPath = std::filesystem::temp_directory_path() / "gbcore-logger-test.log";
    std::error_code ec;
    std::filesystem::remove(logPath, ec);

    Logger::logError("dropped before init");
    EXPECT_FALSE(Logger::isOpen());

    Logger::init(logPath);
    ASSERT_TRUE(Logger::isOpen());
    Logger::log("profile loaded");
    Logger::logError("CPU fault at $0150");
    Logger::shutdown();
    EXPECT_FALSE(Logger::isOpen());

    std::ifstream in(logPath);
    const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents.find("dropped before init"), std::string::npos);
    EXPECT_NE(contents.find("[INFO ]"), std::string::npos);
    EXPECT_NE(contents.find("profile loaded"), std::string::npos);
    EXPECT_NE(contents.find("[ERROR]"), std::string::npos);
    EXPECT_NE(contents.find("CPU fault at $0150"), std::string::npos);

    std::filesystem::remove(logPath, ec);
}

}  // namespace
}  // namespace gbcore::common
