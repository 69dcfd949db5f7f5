#include <gtest/gtest.h>

#include "../src/main/main_processor.hpp"
#include "../src/utils/verbose/verbose.hpp"

#include <fstream>
#include <json/json.h>
#include <sstream>
#include <string>
#include <vector>

namespace {
int RunMain(std::vector<std::string> arguments) {
  arguments.insert(arguments.begin(), "circuitikz-convert");
  std::vector<char *> argv;
  for (auto &argument : arguments) {
    argv.push_back(argument.data());
  }
  argv.push_back(nullptr);
  MainProcessor main;
  return main.main(static_cast<int>(arguments.size()), argv.data());
}

Json::Value ReadJson(const std::string &path) {
  std::ifstream in(path);
  EXPECT_TRUE(in.is_open()) << "Failed to open output file: " << path;
  Json::CharReaderBuilder builder;
  Json::Value value;
  std::string errors;
  EXPECT_TRUE(Json::parseFromStream(builder, in, &value, &errors)) << errors;
  return value;
}

std::string OutputPath(const std::string &name) {
  return ::testing::TempDir() + name;
}
} // namespace

class RegressionTest : public ::testing::Test {
protected:
  void SetUp() override { utils::verbose::Flags::getInstance().Reset(); }
};

TEST_F(RegressionTest, SeriesRc) {
  auto output = OutputPath("output-rc.json");
  ASSERT_EQ(RunMain({"-u", "cm", "-o", output,
                     std::string(TEST_CASE_PATH) + "input-rc.tex"}),
            MainProcessor::kExitOk);

  auto root = ReadJson(output);
  EXPECT_EQ(root["version"].asString(), "0.1");
  EXPECT_EQ(root["units"].asString(), "cm");
  const auto &elements = root["elements"];
  ASSERT_EQ(elements.size(), 6u);

  EXPECT_EQ(elements[0]["id"].asString(), "component1");
  EXPECT_EQ(elements[0]["kind"].asString(), "V");
  EXPECT_EQ(elements[1]["kind"].asString(), "R");
  EXPECT_EQ(elements[1]["startNode"].asString(), "circ");
  EXPECT_EQ(elements[2]["kind"].asString(), "C");
  EXPECT_EQ(elements[2]["label"]["otherSide"].asString(), "true");
  EXPECT_EQ(elements[3]["type"].asString(), "wire");
  EXPECT_DOUBLE_EQ(elements[3]["points"][1]["x"].asDouble(), 0.0);

  const auto &out = elements[4];
  EXPECT_EQ(out["id"].asString(), "wire2");
  EXPECT_DOUBLE_EQ(out["points"][1]["x"].asDouble(), 4.0);
  EXPECT_DOUBLE_EQ(out["points"][1]["y"].asDouble(), 2.0);
  EXPECT_EQ(out["points"][1]["label"]["value"].asString(), "$V_{out}$");

  EXPECT_EQ(elements[5]["shape"].asString(), "ground");
  EXPECT_DOUBLE_EQ(root["bounds"]["maxX"].asDouble(), 4.0);
}

TEST_F(RegressionTest, ScopeWithBackReferences_Strict) {
  auto output = OutputPath("output-scope.json");
  EXPECT_EQ(RunMain({"-s", "-o", output,
                     std::string(TEST_CASE_PATH) + "input-scope.tex"}),
            MainProcessor::kExitDiagnostics);

  auto root = ReadJson(output);
  EXPECT_EQ(root["units"].asString(), "px");
  const auto &elements = root["elements"];
  ASSERT_EQ(elements.size(), 2u);
  EXPECT_EQ(elements[0]["shape"].asString(), "coordinate");
  EXPECT_EQ(elements[1]["type"].asString(), "group");
  EXPECT_EQ(elements[1]["name"].asString(), "stage");

  const auto &members = elements[1]["elements"];
  ASSERT_EQ(members.size(), 2u);
  EXPECT_EQ(members[0]["shape"].asString(), "ellipse");
  EXPECT_EQ(members[0]["text"]["text"].asString(), "A");
  EXPECT_DOUBLE_EQ(members[1]["points"][1]["x"].asDouble(), 75.591);
}

TEST_F(RegressionTest, WithoutStrict_DiagnosticsStillExitOk) {
  auto output = OutputPath("output-scope-lenient.json");
  EXPECT_EQ(RunMain({"-o", output,
                     std::string(TEST_CASE_PATH) + "input-scope.tex"}),
            MainProcessor::kExitOk);
}

TEST_F(RegressionTest, NoEnvironment_WritesErrorObject) {
  auto output = OutputPath("output-none.json");
  EXPECT_EQ(RunMain({"-o", output,
                     std::string(TEST_CASE_PATH) + "no-environment.tex"}),
            MainProcessor::kExitError);

  auto root = ReadJson(output);
  EXPECT_EQ(root["error"].asString(),
            "No circuitikz or tikzpicture environment found");
}

TEST_F(RegressionTest, MissingInput_Fails) {
  EXPECT_EQ(RunMain({"-o", OutputPath("unused.json"),
                     std::string(TEST_CASE_PATH) + "does-not-exist.tex"}),
            MainProcessor::kExitError);
}

TEST_F(RegressionTest, OutputWithSeveralInputs_Fails) {
  EXPECT_EQ(RunMain({"-o", OutputPath("unused.json"),
                     std::string(TEST_CASE_PATH) + "input-rc.tex",
                     std::string(TEST_CASE_PATH) + "input-scope.tex"}),
            MainProcessor::kExitError);
}

TEST_F(RegressionTest, BadUnits_Fails) {
  EXPECT_EQ(RunMain({"-u", "mm"}), MainProcessor::kExitError);
}

TEST_F(RegressionTest, Version_StopsEarly) {
  EXPECT_EQ(RunMain({"-V", "ignored.tex"}), MainProcessor::kExitOk);
}
