/**
 * @file test_symbol_dictionary.cpp
 * @brief Symbol catalog construction and export
 */

#include <cadence/core/Error.hpp>
#include <cadence/io/SymbolDictionary.hpp>

#include <grounds/FlatGround.hpp>
#include <systems/RollingDisc.hpp>
#include <wheels/KnifeEdgeWheel.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

using namespace cadence;

class SymbolDictionaryTest : public ::testing::Test {
  protected:
    void SetUp() override {
        rolling_disc_ = std::make_unique<models::RollingDisc>("rolling_disc");
        rolling_disc_->AttachSubModel("disc", std::make_unique<models::KnifeEdgeWheel>("disc"));
        rolling_disc_->AttachSubModel("ground", std::make_unique<models::FlatGround>("ground"));
        rolling_disc_->DefineAll();
        dict_ = SymbolDictionary::Build(*rolling_disc_->Registry(), rolling_disc_.get());
    }

    std::unique_ptr<models::RollingDisc> rolling_disc_;
    SymbolDictionary dict_;
};

TEST_F(SymbolDictionaryTest, GroupedByNode) {
    const auto *root = dict_.Find("rolling_disc");
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->type, "RollingDisc");
    EXPECT_EQ(root->coordinates.size(), 5u);
    EXPECT_EQ(root->speeds.size(), 5u);
    EXPECT_EQ(root->coordinates[0].identifier, "rolling_disc.q1[q]");
    EXPECT_EQ(root->coordinates[0].name, "q1");

    const auto *disc = dict_.Find("rolling_disc.disc");
    ASSERT_NE(disc, nullptr);
    EXPECT_EQ(disc->type, "KnifeEdgeWheel");
    EXPECT_FALSE(disc->constants.empty());

    EXPECT_EQ(dict_.Find("rolling_disc.tyre"), nullptr);
    EXPECT_EQ(dict_.Find("bicycle"), nullptr);
}

TEST_F(SymbolDictionaryTest, TotalsMatchRegistry) {
    EXPECT_EQ(dict_.total_coordinates, 5u);
    EXPECT_EQ(dict_.total_speeds, 5u);
    EXPECT_EQ(dict_.total_coordinates + dict_.total_speeds + dict_.total_constants +
                  dict_.total_auxiliaries,
              rolling_disc_->Registry()->Size());
}

TEST_F(SymbolDictionaryTest, WithoutTreeTypesStayEmpty) {
    auto dict = SymbolDictionary::Build(*rolling_disc_->Registry());
    ASSERT_FALSE(dict.nodes.empty());
    EXPECT_TRUE(dict.nodes[0].type.empty());
}

TEST_F(SymbolDictionaryTest, JsonValue) {
    auto j = dict_.ToJSONValue();
    EXPECT_EQ(j["summary"]["coordinates"].get<std::size_t>(), 5u);
    // Children are defined before their parent
    EXPECT_EQ(j["nodes"][0]["path"].get<std::string>(), "rolling_disc.disc");
    EXPECT_EQ(j["nodes"][0]["constants"][0]["identifier"].get<std::string>(),
              "rolling_disc.disc.r");
    EXPECT_EQ(j["nodes"][2]["coordinates"][0]["identifier"].get<std::string>(),
              "rolling_disc.q1[q]");
}

TEST_F(SymbolDictionaryTest, ExportFiles) {
    auto dir = std::filesystem::temp_directory_path();
    auto yaml_path = (dir / "cadence_symbols_test.yaml").string();
    auto json_path = (dir / "cadence_symbols_test.json").string();

    dict_.ToYAML(yaml_path);
    YAML::Node yaml = YAML::LoadFile(yaml_path);
    EXPECT_EQ(yaml["summary"]["speeds"].as<std::size_t>(), 5u);
    EXPECT_EQ(yaml["nodes"][0]["type"].as<std::string>(), "KnifeEdgeWheel");

    dict_.ToJSON(json_path);
    std::ifstream file(json_path);
    auto j = nlohmann::json::parse(file);
    EXPECT_EQ(j["summary"]["speeds"].get<std::size_t>(), 5u);

    std::filesystem::remove(yaml_path);
    std::filesystem::remove(json_path);
}

TEST_F(SymbolDictionaryTest, UnwritablePath) {
    EXPECT_THROW(dict_.ToYAML("/nonexistent_directory/symbols.yaml"), IOError);
    EXPECT_THROW(dict_.ToJSON("/nonexistent_directory/symbols.json"), IOError);
}
