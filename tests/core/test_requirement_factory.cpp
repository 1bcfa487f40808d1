/**
 * @file test_requirement_factory.cpp
 * @brief Unit tests for role requirements and the model factory
 */

#include <cadence/core/Error.hpp>
#include <cadence/core/ModelFactory.hpp>
#include <cadence/core/Requirement.hpp>

#include <Registration.hpp>
#include <joints/RevoluteJoint.hpp>
#include <systems/RollingDisc.hpp>
#include <testing/TestModels.hpp>

#include <gtest/gtest.h>

#include <algorithm>

using namespace cadence;

namespace {

bool Contains(const std::vector<std::string> &names, const std::string &name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

/// Registered through the factory macros below
class TestGadget : public test_models::PortModel {
  public:
    explicit TestGadget(std::string name) : PortModel(std::move(name)) {}

    static std::vector<std::string> TypeFamilies() { return {"GadgetBase"}; }

    [[nodiscard]] std::string TypeName() const override { return "TestGadget"; }
};

class TestCoupling : public test_models::LinkConnection {
  public:
    TestCoupling(std::string name, std::vector<Interface *> interfaces)
        : LinkConnection(std::move(name), std::move(interfaces)) {}

    static std::vector<std::string> TypeFamilies() { return {"CouplingBase"}; }

    [[nodiscard]] std::string TypeName() const override { return "TestCoupling"; }
};

} // namespace

CADENCE_REGISTER_MODEL_AS(TestGadget, "TestGadget")
CADENCE_REGISTER_CONNECTION_AS(TestCoupling, "TestCoupling")

// =============================================================================
// Requirement
// =============================================================================

TEST(Requirement, DefaultsDerivedFromRole) {
    Requirement req("front_wheel", {"WheelBase"});

    EXPECT_EQ(req.AttributeName(), "front_wheel");
    EXPECT_EQ(req.FullName(), "Front wheel");
    EXPECT_EQ(req.TypeName(), "WheelBase");
    EXPECT_EQ(req.Description(), "WheelBase model.");
    EXPECT_FALSE(req.Hard());
    EXPECT_EQ(req.Kind(), RequirementKind::Model);
}

TEST(Requirement, ExplicitValuesKept) {
    Requirement req("rear_frame", {"RigidLink", "FrameBase"}, "Rear frame of the bicycle.", true,
                    "Rear frame body");

    EXPECT_EQ(req.FullName(), "Rear frame body");
    EXPECT_EQ(req.TypeName(), "RigidLink or FrameBase");
    EXPECT_EQ(req.Description(), "Rear frame of the bicycle.");
    EXPECT_TRUE(req.Hard());
    EXPECT_TRUE(req.IsSatisfiedBy({"CustomFrame", "FrameBase"}));
    EXPECT_FALSE(req.IsSatisfiedBy({"KnifeEdgeWheel", "WheelBase"}));
}

TEST(Requirement, ConnectionShorthand) {
    Requirement req = Requirement::Connection("tyre", {"TyreBase"});
    EXPECT_EQ(req.Kind(), RequirementKind::Connection);
    EXPECT_EQ(req.FullName(), "Tyre");
    EXPECT_FALSE(req.Hard());
}

TEST(Requirement, InvalidDefinitionsRejected) {
    EXPECT_THROW(Requirement("front wheel", {"WheelBase"}), DefinitionError);
    EXPECT_THROW(Requirement("2nd_wheel", {"WheelBase"}), DefinitionError);
    EXPECT_THROW(Requirement("wheel", {}), DefinitionError);
}

// =============================================================================
// ModelFactory
// =============================================================================

class ModelFactoryTest : public ::testing::Test {
  protected:
    void SetUp() override { models::RegisterModels(); }

    ModelFactory &factory_ = ModelFactory::Instance();
};

TEST_F(ModelFactoryTest, BuiltInTypesRegistered) {
    for (const char *type :
         {"FlatGround", "KnifeEdgeWheel", "ToroidalWheel", "RigidLink", "TwoPinStickLeg",
          "RevoluteJoint", "WeldJoint", "NonHolonomicTyre", "RollingDisc", "Pendulum"}) {
        EXPECT_TRUE(factory_.HasType(type)) << type;
    }
    EXPECT_TRUE(factory_.HasType("WheelBase"));
    EXPECT_TRUE(factory_.Lookup("WheelBase").IsAbstract());
    EXPECT_FALSE(factory_.Lookup("KnifeEdgeWheel").IsAbstract());
    EXPECT_TRUE(factory_.Lookup("LegBase").IsAbstract());
    EXPECT_TRUE(Contains(factory_.GetFromRequirement(Requirement("leg", {"LegBase"})),
                         "TwoPinStickLeg"));
}

TEST_F(ModelFactoryTest, RequirementLookup) {
    Requirement wheel("wheel", {"WheelBase"});
    auto concrete = factory_.GetFromRequirement(wheel);
    EXPECT_TRUE(Contains(concrete, "KnifeEdgeWheel"));
    EXPECT_TRUE(Contains(concrete, "ToroidalWheel"));
    EXPECT_FALSE(Contains(concrete, "WheelBase"));
    EXPECT_FALSE(Contains(concrete, "FlatGround"));

    auto with_abstract = factory_.GetFromRequirement(wheel, false);
    EXPECT_TRUE(Contains(with_abstract, "WheelBase"));
    EXPECT_TRUE(Contains(with_abstract, "KnifeEdgeWheel"));

    auto joints = factory_.GetFromRequirement(Requirement::Connection("joint", {"JointBase"}));
    EXPECT_TRUE(Contains(joints, "RevoluteJoint"));
    EXPECT_TRUE(Contains(joints, "WeldJoint"));
    EXPECT_FALSE(Contains(joints, "NonHolonomicTyre"));
}

TEST_F(ModelFactoryTest, KindSeparatesModelsFromConnections) {
    // A model requirement never lists connection types, even for a shared family name
    auto as_model = factory_.GetFromRequirement(Requirement("tyre", {"TyreBase"}), false);
    EXPECT_TRUE(as_model.empty());
}

TEST_F(ModelFactoryTest, PropertyLookupOnModel) {
    models::RollingDisc disc("rolling_disc");

    auto discs = factory_.GetFromProperty(disc, "disc");
    EXPECT_TRUE(Contains(discs, "KnifeEdgeWheel"));
    auto tyres = factory_.GetFromProperty(disc, "tyre");
    EXPECT_TRUE(Contains(tyres, "NonHolonomicTyre"));

    EXPECT_THROW(static_cast<void>(factory_.GetFromProperty(disc, "handlebar")), ConfigError);
}

TEST_F(ModelFactoryTest, CreateModelAppliesOptions) {
    ModelOptions options;
    options.name = "front";
    options.type = "KnifeEdgeWheel";
    options.strings["note"] = "test";

    auto model = factory_.CreateModel(options);
    ASSERT_NE(model, nullptr);
    EXPECT_EQ(model->Name(), "front");
    EXPECT_EQ(model->TypeName(), "KnifeEdgeWheel");
    EXPECT_EQ(model->Options().Get<std::string>("note", ""), "test");
}

TEST_F(ModelFactoryTest, CreateConnectionJoinsInterfaces) {
    auto root = std::make_unique<test_models::GroupModel>("root");
    auto &a = root->AttachSubModel("a", std::make_unique<test_models::PortModel>("a"));
    auto &b = root->AttachSubModel("b", std::make_unique<test_models::PortModel>("b"));

    ModelOptions options;
    options.name = "hinge";
    options.type = "RevoluteJoint";
    options.strings["axis"] = "x";

    auto connection = factory_.CreateConnection(options, {&a.Port(), &b.Port()});
    auto *joint = dynamic_cast<models::RevoluteJoint *>(connection.get());
    ASSERT_NE(joint, nullptr);
    EXPECT_EQ(&joint->GetInterface(0), &a.Port());
    EXPECT_EQ(joint->Options().Get<std::string>("axis", ""), "x");
}

TEST_F(ModelFactoryTest, InvalidCreationRejected) {
    ModelOptions options;
    options.name = "thing";

    options.type = "NoSuchModel";
    EXPECT_THROW(static_cast<void>(factory_.CreateModel(options)), ConfigError);

    options.type = "WheelBase";
    EXPECT_THROW(static_cast<void>(factory_.CreateModel(options)), ConfigError);

    options.type = "RevoluteJoint";
    EXPECT_THROW(static_cast<void>(factory_.CreateModel(options)), ConfigError);

    options.type = "KnifeEdgeWheel";
    EXPECT_THROW(static_cast<void>(factory_.CreateConnection(options, {})), ConfigError);
}

TEST_F(ModelFactoryTest, MacroRegistration) {
    ASSERT_TRUE(factory_.HasType("TestGadget"));
    ASSERT_TRUE(factory_.HasType("TestCoupling"));

    const auto &entry = factory_.Lookup("TestGadget");
    EXPECT_TRUE(Contains(entry.families, "TestGadget"));
    EXPECT_TRUE(Contains(entry.families, "GadgetBase"));

    ModelOptions options;
    options.name = "gadget";
    options.type = "TestGadget";
    auto model = factory_.CreateModel(options);
    EXPECT_EQ(model->TypeName(), "TestGadget");

    auto couplings =
        factory_.GetFromRequirement(Requirement::Connection("coupling", {"CouplingBase"}));
    ASSERT_EQ(couplings.size(), 1u);
    EXPECT_EQ(couplings[0], "TestCoupling");
}

TEST(ModelFactory, AbstractNamingConvention) {
    EXPECT_TRUE(ModelFactory::IsAbstractName("WheelBase"));
    EXPECT_TRUE(ModelFactory::IsAbstractName("Base"));
    EXPECT_FALSE(ModelFactory::IsAbstractName("KnifeEdgeWheel"));
    EXPECT_FALSE(ModelFactory::IsAbstractName("Bas"));
}
