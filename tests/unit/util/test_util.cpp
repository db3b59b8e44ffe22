#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "pushid/common.hpp"
#include "pushid/util/logging.hpp"
#include "pushid/util/time.hpp"
#include "test_helpers.hpp"

using namespace pushid::util;
using namespace pushid::test;
using pushid::ErrorCode;

TEST(TimeTest, Rfc3339Epoch) {
  EXPECT_EQ(Time::toRfc3339(std::chrono::system_clock::time_point{}), "1970-01-01T00:00:00.000Z");
}

TEST(TimeTest, Rfc3339KeepsMilliseconds) {
  std::chrono::system_clock::time_point tp{std::chrono::milliseconds(1700000000123)};
  EXPECT_EQ(Time::toRfc3339(tp), "2023-11-14T22:13:20.123Z");
}

TEST(LoggingTest, ParseLevels) {
  EXPECT_EQ(parseLogLevel("trace"), spdlog::level::trace);
  EXPECT_EQ(parseLogLevel("warn"), spdlog::level::warn);
  EXPECT_EQ(parseLogLevel("error"), spdlog::level::err);
  EXPECT_EQ(parseLogLevel("off"), spdlog::level::off);
  EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(LoggingTest, UnknownLevelRejected) {
  LoggingOptions options;
  options.level = "chatty";
  EXPECT_ERROR(initializeLogging(options), ErrorCode::kConfigError);
}

class LoggingFileTest : public TempDirTest {
 protected:
  void TearDown() override {
    // Detach from the file before the directory goes away
    ASSERT_OK(initializeLogging(LoggingOptions{}));
    TempDirTest::TearDown();
  }
};

TEST_F(LoggingFileTest, WritesToRotatingFile) {
  LoggingOptions options;
  options.level = "info";
  options.file = (temp_dir_ / "logs" / "pushid.log").string();

  ASSERT_OK(initializeLogging(options));
  EXPECT_EQ(spdlog::default_logger()->name(), "pushid");
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::info);

  spdlog::info("logging test entry");
  spdlog::default_logger()->flush();

  EXPECT_TRUE(std::filesystem::exists(options.file));
  EXPECT_GT(std::filesystem::file_size(options.file), 0u);
}

TEST(ErrorCodeTest, Names) {
  EXPECT_EQ(pushid::errorCodeToString(ErrorCode::kTimestampOverflow), "Timestamp overflow");
  EXPECT_EQ(pushid::errorCodeToString(ErrorCode::kLengthInvariant), "Length invariant violated");
  EXPECT_EQ(pushid::errorCodeToString(ErrorCode::kSuffixExhausted), "Suffix exhausted");
}

TEST(VersionTest, ToString) {
  pushid::Version version{1, 2, 3, ""};
  EXPECT_EQ(version.toString(), "1.2.3");
  version.build = "dev";
  EXPECT_EQ(version.toString(), "1.2.3+dev");
}
