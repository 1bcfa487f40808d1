/**
 * @file test_model_loader.cpp
 * @brief Building model trees from YAML descriptions
 */

#include <cadence/assembly/AggregatedSystem.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/io/ModelLoader.hpp>

#include <Registration.hpp>
#include <systems/RollingDisc.hpp>

#include <gtest/gtest.h>

using namespace cadence;
using io::ModelLoader;

namespace {

const char *kRollingDiscYaml = R"(
model:
  type: RollingDisc
  name: rolling_disc
  children:
    - role: disc
      type: KnifeEdgeWheel
      name: front_disc
    - type: FlatGround
      name: ground
      options:
        strings:
          normal: -z
  connections:
    - type: NonHolonomicTyre
      name: contact
      role: tyre
      interfaces: [ground.surface, disc.hub]
)";

class ModelLoaderTest : public ::testing::Test {
  protected:
    void SetUp() override { models::RegisterModels(); }
};

} // namespace

// =============================================================================
// Parsing
// =============================================================================

TEST_F(ModelLoaderTest, ParseDescription) {
    auto desc = ModelLoader::Parse(kRollingDiscYaml);

    EXPECT_EQ(desc.options.type, "RollingDisc");
    EXPECT_EQ(desc.options.name, "rolling_disc");
    ASSERT_EQ(desc.children.size(), 2u);
    EXPECT_EQ(desc.children[0].role, "disc");
    EXPECT_EQ(desc.children[0].options.name, "front_disc");
    // Role falls back to the name
    EXPECT_EQ(desc.children[1].role, "ground");
    EXPECT_EQ(desc.children[1].options.strings.at("normal"), "-z");

    ASSERT_EQ(desc.connections.size(), 1u);
    EXPECT_EQ(desc.connections[0].role, "tyre");
    ASSERT_EQ(desc.connections[0].interfaces.size(), 2u);
    EXPECT_EQ(desc.connections[0].interfaces[1], "disc.hub");
}

TEST_F(ModelLoaderTest, MissingModelSection) {
    EXPECT_THROW(static_cast<void>(ModelLoader::Parse("other: 1\n")), ConfigError);
}

TEST_F(ModelLoaderTest, MissingTypeRejected) {
    EXPECT_THROW(static_cast<void>(ModelLoader::Parse("model:\n  name: thing\n")), ConfigError);
}

// =============================================================================
// Building
// =============================================================================

TEST_F(ModelLoaderTest, BuildAndDefineRollingDisc) {
    auto model = ModelLoader::Build(ModelLoader::Parse(kRollingDiscYaml));
    auto *rolling_disc = dynamic_cast<models::RollingDisc *>(model.get());
    ASSERT_NE(rolling_disc, nullptr);
    EXPECT_EQ(rolling_disc->Disc().Path(), "rolling_disc.front_disc");
    EXPECT_EQ(rolling_disc->GetConnection("tyre").Name(), "contact");

    rolling_disc->DefineAll();
    AggregatedSystem system = Aggregate(*rolling_disc);
    EXPECT_EQ(system.Coordinates().size(), 5u);
    EXPECT_EQ(system.NonholonomicConstraints().size(), 2u);
}

TEST_F(ModelLoaderTest, UnknownTypeRejected) {
    const char *yaml = R"(
model:
  type: Unicycle
  name: unicycle
)";
    EXPECT_THROW(static_cast<void>(ModelLoader::Build(ModelLoader::Parse(yaml))), ConfigError);
}

TEST_F(ModelLoaderTest, BadInterfacePathRejected) {
    const char *yaml = R"(
model:
  type: RollingDisc
  name: rolling_disc
  children:
    - { role: disc, type: KnifeEdgeWheel, name: disc }
    - { role: ground, type: FlatGround, name: ground }
  connections:
    - type: NonHolonomicTyre
      name: tyre
      interfaces: [ground.surface, disc.axle]
)";
    try {
        static_cast<void>(ModelLoader::Build(ModelLoader::Parse(yaml)));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_NE(std::string(e.what()).find("disc.axle"), std::string::npos);
    }
}

TEST_F(ModelLoaderTest, ResolveInterfaceWalksRoles) {
    auto model = ModelLoader::Build(ModelLoader::Parse(kRollingDiscYaml));
    Interface &hub = ModelLoader::ResolveInterface(*model, "disc.hub");
    EXPECT_EQ(hub.Path(), "rolling_disc.front_disc.hub");
    EXPECT_THROW(static_cast<void>(ModelLoader::ResolveInterface(*model, "wheel.hub")),
                 ConfigError);
}

TEST_F(ModelLoaderTest, LoadMissingFile) {
    EXPECT_THROW(static_cast<void>(ModelLoader::Load("/nonexistent_directory/model.yaml")),
                 ConfigError);
}
