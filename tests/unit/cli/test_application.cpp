#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pushid/cli/application.hpp"
#include "test_helpers.hpp"

using namespace pushid::cli;
using namespace pushid::core;
using namespace pushid::test;

class ApplicationTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    setenv("XDG_CONFIG_HOME", temp_dir_.c_str(), 1);

    clock_ = std::make_shared<ManualClock>(0);
    random_ = std::make_shared<ScriptedRandomSource>(0);
    generator_ = std::make_shared<Generator>(clock_, random_);
  }

  // Run the CLI and capture stdout
  int run(std::vector<std::string> args, std::string& output) {
    args.insert(args.begin(), "pushid");
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(arg.data());
    }

    Application app(generator_);
    ::testing::internal::CaptureStdout();
    int code = app.run(static_cast<int>(argv.size()), argv.data());
    output = ::testing::internal::GetCapturedStdout();
    return code;
  }

  std::shared_ptr<ManualClock> clock_;
  std::shared_ptr<ScriptedRandomSource> random_;
  std::shared_ptr<Generator> generator_;
};

TEST_F(ApplicationTest, GenerateSingle) {
  std::string output;
  EXPECT_EQ(run({"generate"}, output), 0);
  EXPECT_EQ(output, std::string(20, '-') + "\n");
}

TEST_F(ApplicationTest, GenerateCount) {
  std::string output;
  EXPECT_EQ(run({"generate", "-n", "3"}, output), 0);
  EXPECT_EQ(output,
            "--------------------\n"
            "-------------------0\n"
            "-------------------1\n");
}

TEST_F(ApplicationTest, GenerateJson) {
  std::string output;
  EXPECT_EQ(run({"--json", "generate", "--count", "2"}, output), 0);

  auto json = nlohmann::json::parse(output);
  EXPECT_EQ(json["count"], 2);
  ASSERT_EQ(json["ids"].size(), 2u);
  EXPECT_EQ(json["ids"][1], "-------------------0");
}

TEST_F(ApplicationTest, GenerateUsesConfiguredCount) {
  auto path = writeFile("config.toml", "[generate]\ncount = 4\n");

  std::string output;
  EXPECT_EQ(run({"--config", path.string(), "generate"}, output), 0);
  EXPECT_EQ(std::count(output.begin(), output.end(), '\n'), 4);
}

TEST_F(ApplicationTest, ConfiguredJsonOutput) {
  auto path = writeFile("config.toml", "[output]\nformat = \"json\"\n");

  std::string output;
  EXPECT_EQ(run({"--config", path.string(), "generate"}, output), 0);
  auto json = nlohmann::json::parse(output);
  EXPECT_EQ(json["count"], 1);
}

TEST_F(ApplicationTest, GenerateCountOutOfRange) {
  std::string output;
  EXPECT_NE(run({"generate", "-n", "0"}, output), 0);
  EXPECT_TRUE(output.empty());
}

TEST_F(ApplicationTest, GenerateReportsExhaustion) {
  random_->push(std::vector<std::uint8_t>(kSuffixLength, 63));

  std::string output;
  EXPECT_EQ(run({"-q", "generate", "-n", "2"}, output), 1);
  EXPECT_EQ(output, "Error: No suffix left for timestamp 0\n");
}

TEST_F(ApplicationTest, InvalidConfigFile) {
  std::string output;
  EXPECT_EQ(run({"--config", (temp_dir_ / "missing.toml").string(), "generate"}, output), 1);
  EXPECT_NE(output.find("Config file not found"), std::string::npos);
}

TEST_F(ApplicationTest, InspectText) {
  std::string output;
  EXPECT_EQ(run({"inspect", "--", "-NjEtLWv-----------0"}, output), 0);

  EXPECT_NE(output.find("-NjEtLWv-----------0"), std::string::npos);
  EXPECT_NE(output.find("timestamp: 1700000000123 (2023-11-14T22:13:20.123Z)"), std::string::npos);
  EXPECT_NE(output.find("suffix:    0 0 0 0 0 0 0 0 0 0 0 1"), std::string::npos);
}

TEST_F(ApplicationTest, InspectJson) {
  std::string output;
  EXPECT_EQ(run({"--json", "inspect", "--", "-NjEtLWv------------", "--------z-----------"}, output), 0);

  auto json = nlohmann::json::parse(output);
  ASSERT_EQ(json.size(), 2u);
  EXPECT_EQ(json[0]["timestamp_ms"], 1700000000123);
  EXPECT_EQ(json[0]["time"], "2023-11-14T22:13:20.123Z");
  EXPECT_EQ(json[1]["timestamp_ms"], 0);
  EXPECT_EQ(json[1]["suffix"][0], 63);
}

TEST_F(ApplicationTest, InspectInvalid) {
  std::string output;
  EXPECT_EQ(run({"--json", "inspect", "not-a-push-id"}, output), 1);

  auto json = nlohmann::json::parse(output);
  EXPECT_EQ(json["code"], static_cast<int>(pushid::ErrorCode::kInvalidArgument));
}
