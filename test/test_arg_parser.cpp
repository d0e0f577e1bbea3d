#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "util/arg_parser.hpp"

using namespace optray;

namespace {

class TestArgParser : public ::testing::Test {
 protected:
  void SetUp() override {
    parser_.AddArgument("-v", 0, "verbose", "make output verbose");
    parser_.AddArgument("-d", 0, "debug", "display debug info");
    parser_.AddArgument("-f", 1, "config-file", "scene config file");
  }

  ArgParseResult Parse(std::vector<std::string> args) {
    args_ = std::move(args);
    argv_.clear();
    for (auto& a : args_) {
      argv_.emplace_back(a.data());
    }
    return parser_.Parse(static_cast<int>(argv_.size()), argv_.data());
  }

  ArgParser parser_;
  std::vector<std::string> args_;
  std::vector<char*> argv_;
};


TEST_F(TestArgParser, KeyValue) {
  auto res = Parse({ "optray_trace", "-f", "scene.json" });
  ASSERT_TRUE(res.count("-f"));
  ASSERT_EQ(res.at("-f").size(), 1u);
  EXPECT_EQ(res.at("-f")[0], "scene.json");
  EXPECT_FALSE(res.count("-v"));
}


TEST_F(TestArgParser, CompactFlags) {
  auto res = Parse({ "optray_trace", "-vd", "-f", "scene.json" });
  EXPECT_TRUE(res.count("-v"));
  EXPECT_TRUE(res.count("-d"));
  EXPECT_EQ(res.at("-f")[0], "scene.json");
}


TEST_F(TestArgParser, TrailingArguments) {
  auto res = Parse({ "optray_trace", "-f", "scene.json", "extra1", "extra2" });
  ASSERT_EQ(res.at("").size(), 2u);
  EXPECT_EQ(res.at("")[1], "extra2");
}


TEST_F(TestArgParser, MissingRequired) {
  EXPECT_THROW(Parse({ "optray_trace", "-v" }), std::invalid_argument);
  EXPECT_THROW(Parse({ "optray_trace", "-f" }), std::invalid_argument);
}


TEST_F(TestArgParser, UnknownCompactFlag) {
  EXPECT_THROW(Parse({ "optray_trace", "-vx", "-f", "scene.json" }), std::invalid_argument);
}


TEST_F(TestArgParser, MultiValues) {
  parser_.AddArgument("--xlim", 2, "x", "view box x range");
  auto res = Parse({ "optray_trace", "--xlim", "-100", "300", "-f", "a.json" });
  ASSERT_EQ(res.at("--xlim").size(), 2u);
  EXPECT_EQ(res.at("--xlim")[0], "-100");
  EXPECT_EQ(res.at("--xlim")[1], "300");
  EXPECT_EQ(res.at("-f")[0], "a.json");
}


TEST_F(TestArgParser, NormalMode) {
  parser_.SetArgMode(ArgMode::kNormal);
  auto res = Parse({ "optray_trace", "-f", "scene.json", "-vd" });
  EXPECT_FALSE(res.count("-v"));
  ASSERT_EQ(res.at("").size(), 1u);
  EXPECT_EQ(res.at("")[0], "-vd");
}


TEST_F(TestArgParser, Usage) {
  auto usage = parser_.Usage("optray_trace");
  EXPECT_EQ(usage.find("USAGE: optray_trace"), 0u);
  EXPECT_NE(usage.find("-f config-file"), std::string::npos);
  EXPECT_NE(usage.find("[-v]"), std::string::npos);
  EXPECT_NE(usage.find("-d: display debug info"), std::string::npos);
}

}  // namespace
