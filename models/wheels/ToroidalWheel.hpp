#pragma once

/**
 * @file ToroidalWheel.hpp
 * @brief Wheel with a toroidal tyre cross-section
 *
 * The rim circle of radius r carries a tube of radius tr. The contact point
 * lies a distance tr below the rim circle along the ground normal, so a
 * leaning wheel touches the ground off its mid-plane.
 *
 * Symbols: radius r, tube radius tr, mass m, central inertia ixx (= izz by
 * symmetry) and iyy about the spin axis.
 */

#include <wheels/WheelBase.hpp>

#include <optional>
#include <string>

namespace cadence {
namespace models {

class ToroidalWheel : public WheelBase {
  public:
    explicit ToroidalWheel(std::string name) : WheelBase(std::move(name)) {}

    [[nodiscard]] std::string TypeName() const override { return "ToroidalWheel"; }

    [[nodiscard]] std::optional<SymbolicScalar> TubeRadius() const override {
        if (!tube_radius_) {
            throw NotReadyError("tube radius of wheel '" + Path() +
                                "' is not available before its objects stage");
        }
        return tube_radius_;
    }

  protected:
    void DefineObjects(DefinitionContext &ctx) override {
        SymbolicScalar r = ctx.Constant("r", "radius of the rim circle");
        tube_radius_ = ctx.Constant("tr", "radius of the tyre tube");
        SymbolicScalar m = ctx.Constant("m", "wheel mass");
        SymbolicScalar ixx = ctx.Constant("ixx", "wheel moment of inertia about a diameter");
        SymbolicScalar iyy = ctx.Constant("iyy", "wheel moment of inertia about the spin axis");
        CreateWheel(ctx, r, m, RigidBody::Inertia(ixx, iyy, ixx));
    }

  private:
    std::optional<SymbolicScalar> tube_radius_;
};

} // namespace models
} // namespace cadence
