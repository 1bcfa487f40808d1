/**
 * @file test_tyres.cpp
 * @brief Contact geometry and constraints of the tyre models
 */

#include <cadence/assembly/AggregatedSystem.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/symbolic/Algebra.hpp>

#include <grounds/FlatGround.hpp>
#include <testing/TestModels.hpp>
#include <tyres/NonHolonomicTyre.hpp>
#include <wheels/KnifeEdgeWheel.hpp>
#include <wheels/ToroidalWheel.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <memory>

using namespace cadence;
using models::FlatGround;
using models::KnifeEdgeWheel;
using models::NonHolonomicTyre;
using models::ToroidalWheel;
using models::WheelBase;
using test_models::ScriptedModel;

namespace {

/**
 * @brief Wheel on a flat ground, oriented by yaw, lean and spin angles
 *
 * The contact point sits at (x, y) on the ground, or a height z above it
 * when the tyre is told the contact is not on the ground.
 */
class WheelOnGround : public ::testing::Test {
  protected:
    void Build(std::unique_ptr<WheelBase> wheel, bool on_ground = true) {
        root_ = std::make_unique<ScriptedModel>("model");
        z_ = nullptr;
        ground_ = &root_->AttachSubModel("ground", std::make_unique<FlatGround>("ground"));
        wheel_ = &root_->AttachSubModel("wheel", std::move(wheel));
        tyre_ = &root_->AddConnection(
            "tyre", std::make_unique<NonHolonomicTyre>(
                        "tyre", std::vector<Interface *>{&ground_->GetInterface("surface"),
                                                         &wheel_->GetInterface("hub")}));
        ModelOptions options;
        options.name = "tyre";
        options.type = "NonHolonomicTyre";
        options.booleans["on_ground"] = on_ground;
        tyre_->SetOptions(options);

        root_->On(DefinitionStage::ObjectsDefined, [this, on_ground](DefinitionContext &ctx) {
            yaw_ = &ctx.Coordinate("q1", "yaw angle");
            lean_ = &ctx.Coordinate("q2", "lean angle");
            spin_ = &ctx.Coordinate("q3", "spin angle");
            x_ = &ctx.Coordinate("x", "contact position along ground.x");
            y_ = &ctx.Coordinate("y", "contact position along ground.y");
            if (!on_ground) {
                z_ = &ctx.Coordinate("z", "contact height above the ground");
            }
            yaw_frame_ = &ctx.NewFrame("yaw_frame");
            lean_frame_ = &ctx.NewFrame("lean_frame");
        });
        root_->On(DefinitionStage::KinematicsDefined, [this](DefinitionContext &) {
            yaw_frame_->OrientAxis(ground_->Frame(), yaw_->value, Axis::Z);
            lean_frame_->OrientAxis(*yaw_frame_, lean_->value, Axis::X);
            wheel_->Frame().OrientAxis(*lean_frame_, spin_->value, Axis::Y);

            Vector planar = ground_->Frame().X() * x_->value + ground_->Frame().Y() * y_->value;
            if (z_ != nullptr) {
                planar += ground_->Normal() * z_->value;
            }
            tyre_->ContactPoint().SetPos(ground_->Origin(), planar);
            if (upward_) {
                tyre_->SetUpwardRadialAxis(upward_());
            }
        });
    }

    /// Contact point relative to the wheel center, in ground components
    [[nodiscard]] SymbolicScalar ContactFromCenter() const {
        return tyre_->ContactPoint().PosFrom(wheel_->Center()).Express(ground_->Frame());
    }

    std::unique_ptr<ScriptedModel> root_;
    FlatGround *ground_ = nullptr;
    WheelBase *wheel_ = nullptr;
    NonHolonomicTyre *tyre_ = nullptr;
    std::function<Vector()> upward_;

    const Symbol *yaw_ = nullptr;
    const Symbol *lean_ = nullptr;
    const Symbol *spin_ = nullptr;
    const Symbol *x_ = nullptr;
    const Symbol *y_ = nullptr;
    const Symbol *z_ = nullptr;
    ReferenceFrame *yaw_frame_ = nullptr;
    ReferenceFrame *lean_frame_ = nullptr;
};

} // namespace

// =============================================================================
// Contact geometry
// =============================================================================

TEST_F(WheelOnGround, KnifeEdgeContactBelowCenter) {
    Build(std::make_unique<KnifeEdgeWheel>("wheel"));
    root_->DefineAll();

    // The ground normal is -z, so the contact lies along +z of the lean frame
    const Vector expected = lean_frame_->Z() * wheel_->Radius();
    EXPECT_TRUE(
        algebra::IsZeroAt(ContactFromCenter() - expected.Express(ground_->Frame())));
    EXPECT_FALSE(wheel_->TubeRadius().has_value());
}

TEST_F(WheelOnGround, ToroidalContactOffsetAlongNormal) {
    Build(std::make_unique<ToroidalWheel>("wheel"));
    root_->DefineAll();

    ASSERT_TRUE(wheel_->TubeRadius().has_value());
    const Vector expected =
        lean_frame_->Z() * wheel_->Radius() - ground_->Normal() * *wheel_->TubeRadius();
    EXPECT_TRUE(
        algebra::IsZeroAt(ContactFromCenter() - expected.Express(ground_->Frame())));
    EXPECT_TRUE(root_->Registry()->Has("model.wheel", "tr", SymbolKind::Constant));
}

TEST_F(WheelOnGround, SuppliedUpwardRadialAxisUsed) {
    Build(std::make_unique<KnifeEdgeWheel>("wheel"));
    upward_ = [this] { return -lean_frame_->Z(); };
    root_->DefineAll();

    ASSERT_TRUE(tyre_->UpwardRadialAxis().has_value());
    const Vector expected = lean_frame_->Z() * wheel_->Radius();
    EXPECT_TRUE(
        algebra::IsZeroAt(ContactFromCenter() - expected.Express(ground_->Frame())));
}

TEST_F(WheelOnGround, InvalidUpwardRadialAxisRejected) {
    struct Case {
        std::function<Vector()> axis;
        const char *reason;
    };
    const std::vector<Case> cases = {
        {[this] { return lean_frame_->Z() * SymbolicScalar(2.0); }, "unit vector"},
        {[this] { return ground_->Normal(); }, "normal to"},
        {[this] { return lean_frame_->X(); }, "plane"},
    };

    for (const auto &c : cases) {
        Build(std::make_unique<KnifeEdgeWheel>("wheel"));
        upward_ = c.axis;
        try {
            root_->DefineAll();
            FAIL() << "expected ConfigError for " << c.reason;
        } catch (const ConfigError &e) {
            EXPECT_EQ(e.node_path(), "model.tyre");
            EXPECT_EQ(e.stage_name(), "kinematics");
            EXPECT_NE(e.message().find(c.reason), std::string::npos) << e.message();
        }
    }
}

// =============================================================================
// Constraints
// =============================================================================

TEST_F(WheelOnGround, ContactOnGroundAddsRollingConstraintsOnly) {
    Build(std::make_unique<KnifeEdgeWheel>("wheel"));
    root_->DefineAll();
    AggregatedSystem system = Aggregate(*root_);

    EXPECT_TRUE(system.HolonomicConstraints().empty());
    EXPECT_EQ(system.NonholonomicConstraints().size(), 2u);
}

TEST_F(WheelOnGround, LiftedContactAddsHeightConstraint) {
    Build(std::make_unique<KnifeEdgeWheel>("wheel"), false);
    root_->DefineAll();
    AggregatedSystem system = Aggregate(*root_);

    ASSERT_EQ(system.HolonomicConstraints().size(), 1u);
    EXPECT_EQ(system.NonholonomicConstraints().size(), 2u);
    EXPECT_TRUE(algebra::IsZeroAt(system.HolonomicConstraints()[0].expr - z_->value));

    // One constraint per tangent direction of the ground
    for (const auto &eq : system.NonholonomicConstraints()) {
        EXPECT_TRUE(algebra::DependsOn(eq.expr, x_->rate) ||
                    algebra::DependsOn(eq.expr, y_->rate));
    }
}
