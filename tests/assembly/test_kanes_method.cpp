/**
 * @file test_kanes_method.cpp
 * @brief Aggregation and Kane's method equations of motion
 */

#include <cadence/assembly/AggregatedSystem.hpp>
#include <cadence/assembly/KanesMethodSolver.hpp>
#include <cadence/core/Error.hpp>

#include <grounds/FlatGround.hpp>
#include <joints/RevoluteJoint.hpp>
#include <joints/WeldJoint.hpp>
#include <links/RigidLink.hpp>
#include <systems/Pendulum.hpp>
#include <testing/TestModels.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <functional>
#include <memory>

using namespace cadence;
using models::FlatGround;
using models::Pendulum;
using models::RevoluteJoint;
using models::RigidLink;
using models::WeldJoint;
using test_models::MountModel;
using test_models::ScriptedModel;

namespace {

constexpr double kTol = 1e-9;

NumericVector Values(std::initializer_list<double> values) {
    NumericVector v(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double x : values) {
        v(i++) = x;
    }
    return v;
}

/// Two links hinged together; a weld pins the rear link to the inertial mount
std::unique_ptr<ScriptedModel> MakeHingedLinks() {
    auto root = std::make_unique<ScriptedModel>("bike");
    auto &mount = root->AttachSubModel("mount", std::make_unique<MountModel>("mount"));
    auto &rear = root->AttachSubModel("rear", std::make_unique<RigidLink>("rear"));
    auto &front = root->AttachSubModel("front", std::make_unique<RigidLink>("front"));
    root->AddConnection(std::make_unique<WeldJoint>(
        "pin", std::vector<Interface *>{&mount.Mount(), &rear.GetInterface("proximal")}));
    root->AddConnection(std::make_unique<RevoluteJoint>(
        "steer",
        std::vector<Interface *>{&rear.GetInterface("distal"), &front.GetInterface("proximal")}));
    return root;
}

std::unique_ptr<Pendulum> MakePendulum() {
    auto pendulum = std::make_unique<Pendulum>("pendulum");
    pendulum->AttachSubModel("ground", std::make_unique<FlatGround>("ground"));
    pendulum->AttachSubModel("link", std::make_unique<RigidLink>("link"));
    return pendulum;
}

const std::map<std::string, double> kPendulumValues = {
    {"pendulum.ground.g", 9.81}, {"pendulum.link.l", 1.5},  {"pendulum.link.m", 2.0},
    {"pendulum.link.ixx", 0.1},  {"pendulum.link.iyy", 0.4}, {"pendulum.link.izz", 0.4},
    {"pendulum.joint.T[aux]", 3.0},
};

} // namespace

// =============================================================================
// Aggregation
// =============================================================================

TEST(Aggregate, HingedLinksContent) {
    auto root = MakeHingedLinks();
    root->DefineAll();
    AggregatedSystem system = Aggregate(*root);

    EXPECT_EQ(system.Coordinates().size(), 1u);
    EXPECT_EQ(system.Speeds().size(), 1u);
    EXPECT_EQ(system.Bodies().size(), 2u);
    EXPECT_EQ(system.KinematicEquations().size(), 1u);
    EXPECT_EQ(system.Coordinates()[0]->identifier, "bike.steer.q[q]");
    EXPECT_EQ(system.Coordinates()[0]->owner_path, "bike.steer");

    // Depth first in attachment order
    EXPECT_EQ(system.Bodies()[0]->name, "bike.rear.body");
    EXPECT_EQ(system.Bodies()[1]->name, "bike.front.body");

    ASSERT_NE(system.InertialFrame(), nullptr);
    EXPECT_EQ(system.InertialFrame()->Name(), "bike.mount.frame");

    auto ownership = system.OwnershipTable();
    ASSERT_EQ(ownership.size(), 2u);
    EXPECT_EQ(ownership[0].first, "bike.steer.q[q]");
    EXPECT_EQ(ownership[1].first, "bike.steer.u[u]");
    EXPECT_EQ(ownership[1].second, "bike.steer");
}

TEST(Aggregate, LifecycleErrors) {
    auto root = MakeHingedLinks();
    EXPECT_THROW(static_cast<void>(Aggregate(*root)), NotReadyError);

    root->DefineAll();
    EXPECT_THROW(static_cast<void>(Aggregate(root->GetSubModel("rear"))), StructuralError);

    AggregatedSystem system = Aggregate(*root);
    EXPECT_EQ(root->Registry(), nullptr);
    EXPECT_GT(system.Registry().Size(), 0u);
    EXPECT_THROW(static_cast<void>(Aggregate(*root)), AlreadyDefinedError);
}

TEST(Aggregate, FailedDefinitionCannotBeAggregated) {
    auto root = std::make_unique<ScriptedModel>("root");
    root->On(DefinitionStage::LoadsDefined,
             [](DefinitionContext &) { throw NotReadyError("tyre not attached"); });
    EXPECT_THROW(root->DefineAll(), NotReadyError);
    EXPECT_THROW(static_cast<void>(Aggregate(*root)), NotReadyError);
}

// =============================================================================
// Kane's method
// =============================================================================

TEST(KanesMethod, HingedLinksMassMatrix) {
    auto root = MakeHingedLinks();
    root->DefineAll();
    AggregatedSystem system = Aggregate(*root);

    KanesMethodSolver solver;
    EquationsOfMotion eom = solver.Solve(system);
    ASSERT_EQ(eom.mass_matrix.size1(), 1);
    ASSERT_EQ(eom.mass_matrix.size2(), 1);
    EXPECT_EQ(eom.NumIndependentSpeeds(), 1u);
    EXPECT_EQ(solver.Name(), "KanesMethod");

    std::map<std::string, double> values = {
        {"bike.rear.l", 1.0},   {"bike.rear.m", 5.0},   {"bike.rear.ixx", 0.1},
        {"bike.rear.iyy", 0.5}, {"bike.rear.izz", 0.5}, {"bike.front.l", 0.8},
        {"bike.front.m", 2.0},  {"bike.front.ixx", 0.05}, {"bike.front.iyy", 0.2},
        {"bike.front.izz", 0.3},
    };
    NumericVector p = test_models::ParameterValues(system, values);

    // Rotation about the hinge z axis: M = m (l/2)^2 + izz, no forcing
    janus::Function f = eom.MakeFunction();
    auto res = f(Values({0.7}), Values({2.0}), p);
    EXPECT_NEAR(res[0](0, 0), 2.0 * 0.4 * 0.4 + 0.3, kTol);
    EXPECT_NEAR(res[1](0, 0), 0.0, kTol);
}

TEST(KanesMethod, PendulumEquations) {
    auto pendulum = MakePendulum();
    pendulum->DefineAll();
    AggregatedSystem system = Aggregate(*pendulum);
    EquationsOfMotion eom = KanesMethodSolver().Solve(system);

    NumericVector p = test_models::ParameterValues(system, kPendulumValues);
    janus::Function f = eom.MakeFunction();

    for (double q : {0.0, 0.3, -1.2}) {
        auto res = f(Values({q}), Values({0.5}), p);
        EXPECT_NEAR(res[0](0, 0), 2.0 * 1.5 * 1.5 / 4.0 + 0.4, kTol);
        EXPECT_NEAR(res[1](0, 0), -2.0 * 9.81 * 0.75 * std::cos(q), kTol);
    }
}

TEST(KanesMethod, PendulumWithSwappedJointSides) {
    // The ground hangs off the link, so the ground origin ends up below the point root
    auto pendulum = MakePendulum();
    auto &ground = pendulum->GetSubModel("ground");
    auto &link = pendulum->GetSubModel("link");
    pendulum->AddConnection(
        "joint", std::make_unique<RevoluteJoint>(
                     "joint",
                     std::vector<Interface *>{&link.GetInterface("proximal"),
                                              &ground.GetInterface("surface")},
                     Axis::Y));
    pendulum->DefineAll();
    AggregatedSystem system = Aggregate(*pendulum);
    EquationsOfMotion eom = KanesMethodSolver().Solve(system);

    NumericVector p = test_models::ParameterValues(system, kPendulumValues);
    janus::Function f = eom.MakeFunction();

    // The link angle is -q, so F(q) equals -F(-q) of the regular pendulum
    for (double q : {0.0, 0.3, -1.2}) {
        auto res = f(Values({q}), Values({0.5}), p);
        EXPECT_NEAR(res[0](0, 0), 2.0 * 1.5 * 1.5 / 4.0 + 0.4, kTol);
        EXPECT_NEAR(res[1](0, 0), 2.0 * 9.81 * 0.75 * std::cos(q), kTol);
    }
}

TEST(KanesMethod, ActuatedJointAddsTorque) {
    auto pendulum = MakePendulum();
    auto &ground = pendulum->GetSubModel("ground");
    auto &link = pendulum->GetSubModel("link");
    auto &joint = pendulum->AddConnection(
        "joint", std::make_unique<RevoluteJoint>(
                     "joint",
                     std::vector<Interface *>{&ground.GetInterface("surface"),
                                              &link.GetInterface("proximal")},
                     Axis::Y));
    ModelOptions options;
    options.name = "joint";
    options.type = "RevoluteJoint";
    options.booleans["actuated"] = true;
    joint.SetOptions(options);

    pendulum->DefineAll();
    AggregatedSystem system = Aggregate(*pendulum);
    ASSERT_EQ(system.Auxiliaries().size(), 1u);
    EXPECT_EQ(system.Auxiliaries()[0]->identifier, "pendulum.joint.T[aux]");

    EquationsOfMotion eom = KanesMethodSolver().Solve(system);
    NumericVector p = test_models::ParameterValues(system, kPendulumValues);
    auto res = eom.MakeFunction()(Values({0.3}), Values({0.0}), p);
    EXPECT_NEAR(res[1](0, 0), -2.0 * 9.81 * 0.75 * std::cos(0.3) + 3.0, kTol);
}

// =============================================================================
// Solver errors
// =============================================================================

namespace {

/// Root with its own inertial frame, one coordinate and one speed
std::unique_ptr<ScriptedModel> MakeSlider(bool with_kde, bool mark_dependent) {
    auto root = std::make_unique<ScriptedModel>("slider");
    auto symbols = std::make_shared<std::pair<const Symbol *, const Symbol *>>();
    root->On(DefinitionStage::ObjectsDefined, [symbols](DefinitionContext &ctx) {
        ctx.SetInertialFrame(ctx.NewFrame("n"), ctx.NewPoint("o"));
        symbols->first = &ctx.Coordinate("x", "slider position");
        symbols->second = &ctx.Speed("v", "slider velocity");
        ctx.NewRigidBody("block", ctx.Constant("m"), RigidBody::Inertia(1.0, 1.0, 1.0));
    });
    root->On(DefinitionStage::KinematicsDefined, [symbols, with_kde](DefinitionContext &ctx) {
        if (with_kde) {
            ctx.AddKinematicEquation(symbols->first->rate - symbols->second->value);
        }
    });
    root->On(DefinitionStage::ConstraintsDefined, [symbols, mark_dependent](DefinitionContext &ctx) {
        if (mark_dependent) {
            ctx.MarkDependentSpeed(symbols->second->value);
        }
    });
    return root;
}

} // namespace

TEST(KanesMethod, MissingKinematicEquationReportsOwnership) {
    auto root = MakeSlider(false, false);
    root->DefineAll();
    AggregatedSystem system = Aggregate(*root);

    try {
        static_cast<void>(KanesMethodSolver().Solve(system));
        FAIL() << "expected SolverError";
    } catch (const SolverError &e) {
        ASSERT_EQ(e.ownership().size(), 2u);
        EXPECT_EQ(e.ownership()[0].first, "slider.x[q]");
        EXPECT_EQ(e.ownership()[0].second, "slider");
        EXPECT_NE(std::string(e.what()).find("slider.v[u] <- slider"), std::string::npos);
    }
}

TEST(KanesMethod, DependentSpeedWithoutConstraint) {
    auto root = MakeSlider(true, true);
    root->DefineAll();
    AggregatedSystem system = Aggregate(*root);
    EXPECT_THROW(static_cast<void>(KanesMethodSolver().Solve(system)), SolverError);
}

TEST(KanesMethod, NoInertialFrame) {
    auto root = std::make_unique<ScriptedModel>("floating");
    root->On(DefinitionStage::ObjectsDefined,
             [](DefinitionContext &ctx) { ctx.Coordinate("q", "free angle"); });
    root->DefineAll();
    AggregatedSystem system = Aggregate(*root);
    EXPECT_THROW(static_cast<void>(KanesMethodSolver().Solve(system)), SolverError);
}

TEST(KanesMethod, BodyWithoutKinematicsReported) {
    // The block never gets a velocity in the inertial frame
    auto root = MakeSlider(true, false);
    root->DefineAll();
    AggregatedSystem system = Aggregate(*root);
    EXPECT_THROW(static_cast<void>(KanesMethodSolver().Solve(system)), SolverError);
}

namespace {

/// Two coordinates and two speeds; the hooks supply the equations
std::unique_ptr<ScriptedModel> MakeTwoSpeedSystem(
    std::function<void(DefinitionContext &, const std::vector<const Symbol *> &)> kinematics,
    std::function<void(DefinitionContext &, const std::vector<const Symbol *> &)> constraints) {
    auto root = std::make_unique<ScriptedModel>("cart");
    auto symbols = std::make_shared<std::vector<const Symbol *>>();
    root->On(DefinitionStage::ObjectsDefined, [symbols](DefinitionContext &ctx) {
        ctx.SetInertialFrame(ctx.NewFrame("n"), ctx.NewPoint("o"));
        symbols->push_back(&ctx.Coordinate("q1", "first coordinate"));
        symbols->push_back(&ctx.Coordinate("q2", "second coordinate"));
        symbols->push_back(&ctx.Speed("u1", "first speed"));
        symbols->push_back(&ctx.Speed("u2", "second speed"));
    });
    root->On(DefinitionStage::KinematicsDefined,
             [symbols, kinematics](DefinitionContext &ctx) { kinematics(ctx, *symbols); });
    root->On(DefinitionStage::ConstraintsDefined,
             [symbols, constraints](DefinitionContext &ctx) { constraints(ctx, *symbols); });
    return root;
}

void RegularKinematics(DefinitionContext &ctx, const std::vector<const Symbol *> &s) {
    ctx.AddKinematicEquation(s[0]->rate - s[2]->value);
    ctx.AddKinematicEquation(s[1]->rate - s[3]->value);
}

} // namespace

TEST(KanesMethod, KinematicEquationsMissingACoordinateRate) {
    // Two equations, but both only involve q1'
    auto root = MakeTwoSpeedSystem(
        [](DefinitionContext &ctx, const std::vector<const Symbol *> &s) {
            ctx.AddKinematicEquation(s[0]->rate - s[2]->value);
            ctx.AddKinematicEquation(2.0 * s[0]->rate - s[3]->value);
        },
        [](DefinitionContext &, const std::vector<const Symbol *> &) {});
    root->DefineAll();
    AggregatedSystem system = Aggregate(*root);

    try {
        static_cast<void>(KanesMethodSolver().Solve(system));
        FAIL() << "expected SolverError";
    } catch (const SolverError &e) {
        EXPECT_NE(std::string(e.what()).find("coordinate rate"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("cart.q2[q] <- cart"), std::string::npos);
    }
}

TEST(KanesMethod, ConstraintIndependentOfDependentSpeed) {
    // u2 is marked dependent but the constraint only restricts u1
    auto root = MakeTwoSpeedSystem(
        RegularKinematics, [](DefinitionContext &ctx, const std::vector<const Symbol *> &s) {
            ctx.AddNonholonomicConstraint(s[2]->value - cos(s[0]->value));
            ctx.MarkDependentSpeed(s[3]->value);
        });
    root->DefineAll();
    AggregatedSystem system = Aggregate(*root);

    try {
        static_cast<void>(KanesMethodSolver().Solve(system));
        FAIL() << "expected SolverError";
    } catch (const SolverError &e) {
        EXPECT_NE(std::string(e.what()).find("dependent speeds"), std::string::npos);
        ASSERT_EQ(e.ownership().size(), 4u);
    }
}

TEST(KanesMethod, NonholonomicConstraintWithoutDependentSpeed) {
    auto root = MakeTwoSpeedSystem(
        RegularKinematics, [](DefinitionContext &ctx, const std::vector<const Symbol *> &s) {
            ctx.AddNonholonomicConstraint(s[2]->value - s[3]->value);
        });
    root->DefineAll();
    AggregatedSystem system = Aggregate(*root);
    EXPECT_THROW(static_cast<void>(KanesMethodSolver().Solve(system)), SolverError);
}
