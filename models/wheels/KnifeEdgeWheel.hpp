#pragma once

/**
 * @file KnifeEdgeWheel.hpp
 * @brief Thin disc wheel touching the ground in a single point
 *
 * Symbols: radius r, mass m, central inertia ixx (= izz by symmetry) and iyy
 * about the spin axis.
 */

#include <wheels/WheelBase.hpp>

#include <string>

namespace cadence {
namespace models {

class KnifeEdgeWheel : public WheelBase {
  public:
    explicit KnifeEdgeWheel(std::string name) : WheelBase(std::move(name)) {}

    [[nodiscard]] std::string TypeName() const override { return "KnifeEdgeWheel"; }

  protected:
    void DefineObjects(DefinitionContext &ctx) override {
        SymbolicScalar r = ctx.Constant("r", "wheel radius");
        SymbolicScalar m = ctx.Constant("m", "wheel mass");
        SymbolicScalar ixx = ctx.Constant("ixx", "wheel moment of inertia about a diameter");
        SymbolicScalar iyy = ctx.Constant("iyy", "wheel moment of inertia about the spin axis");
        CreateWheel(ctx, r, m, RigidBody::Inertia(ixx, iyy, ixx));
    }
};

} // namespace models
} // namespace cadence
