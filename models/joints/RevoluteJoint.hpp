#pragma once

/**
 * @file RevoluteJoint.hpp
 * @brief Single-axis hinge between two interfaces
 *
 * Introduces one coordinate q and one speed u. The child frame rotates by q
 * about an axis of the parent frame, the two interface points coincide, and
 * the kinematic differential equation is q' - u = 0.
 *
 * Options:
 *   strings.axis      "x", "y" or "z" (defaults to the constructor argument)
 *   booleans.actuated Add an actuator torque T (auxiliary) about the axis
 */

#include <cadence/core/DefinitionContext.hpp>

#include <joints/JointBase.hpp>

#include <string>
#include <vector>

namespace cadence {
namespace models {

class RevoluteJoint : public JointBase {
  public:
    RevoluteJoint(std::string name, std::vector<Interface *> interfaces, Axis axis = Axis::Z)
        : JointBase(std::move(name), std::move(interfaces)), axis_(axis) {}

    [[nodiscard]] std::string TypeName() const override { return "RevoluteJoint"; }

    [[nodiscard]] Axis JointAxis() const { return axis_; }

    /// Joint angle (after the objects stage)
    [[nodiscard]] const Symbol &Coordinate() const {
        RequireObjects();
        return *q_;
    }

    /// Joint rate (after the objects stage)
    [[nodiscard]] const Symbol &Speed() const {
        RequireObjects();
        return *u_;
    }

  protected:
    void DefineObjects(DefinitionContext &ctx) override {
        axis_ = ParseAxis(Options().Get<std::string>("axis", AxisName(axis_)), Path());
        actuated_ = Options().Get<bool>("actuated", false);

        const std::string relation = "'" + ChildInterface().Owner().Name() + "' relative to '" +
                                     ParentInterface().Owner().Name() + "' about the " +
                                     AxisName(axis_) + " axis";
        q_ = &ctx.Coordinate("q", "rotation angle of " + relation);
        u_ = &ctx.Speed("u", "angular rate of " + relation);
        if (actuated_) {
            torque_ = ctx.Auxiliary("T", "actuator torque about the joint axis");
        }
    }

    void DefineKinematics(DefinitionContext &ctx) override {
        MutableFrame(1).OrientAxis(MutableFrame(0), q_->value, axis_);
        MutablePoint(1).SetPos(MutablePoint(0), Vector());
        ctx.AddKinematicEquation(q_->rate - u_->value);
    }

    void DefineLoads(DefinitionContext &ctx) override {
        if (!actuated_) {
            return;
        }
        const Vector torque = ParentInterface().GetFrame().Unit(axis_) * torque_;
        ctx.AddLoad(Load::Torque(ChildInterface().GetFrame(), torque));
        ctx.AddLoad(Load::Torque(ParentInterface().GetFrame(), -torque));
    }

  private:
    void RequireObjects() const {
        if (q_ == nullptr) {
            throw NotReadyError("symbols of joint '" + Path() +
                                "' are not available before its objects stage");
        }
    }

    Axis axis_;
    bool actuated_ = false;
    const Symbol *q_ = nullptr;
    const Symbol *u_ = nullptr;
    SymbolicScalar torque_;
};

} // namespace models
} // namespace cadence
