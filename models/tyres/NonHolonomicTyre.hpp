#pragma once

/**
 * @file NonHolonomicTyre.hpp
 * @brief Pure rolling tyre without slip
 *
 * The wheel's material point at the contact has zero velocity along both
 * ground tangent directions (two nonholonomic constraints). When the
 * contact point is not constrained to the surface by its coordinates, the
 * "on_ground" option adds the holonomic constraint (contact - origin) . n = 0.
 *
 * Options:
 *   booleans.on_ground  Contact point already lies on the ground (default true)
 */

#include <tyres/TyreBase.hpp>

#include <string>
#include <vector>

namespace cadence {
namespace models {

class NonHolonomicTyre : public TyreBase {
  public:
    NonHolonomicTyre(std::string name, std::vector<Interface *> interfaces)
        : TyreBase(std::move(name), std::move(interfaces)) {}

    [[nodiscard]] std::string TypeName() const override { return "NonHolonomicTyre"; }

  protected:
    void DefineKinematics(DefinitionContext & /*ctx*/) override { SetWheelCenterPos(); }

    void DefineConstraints(DefinitionContext &ctx) override {
        const ReferenceFrame &frame = Ground().Frame();
        const TimeDerivative &derivatives = ctx.Derivatives();

        if (!Options().Get<bool>("on_ground", true)) {
            ctx.AddHolonomicConstraint(
                ContactPoint().PosFrom(Ground().Origin()).Dot(Ground().Normal()));
        }

        const Point &center = Wheel().Center();
        const Vector contact_velocity =
            center.Vel(frame, derivatives) +
            Wheel().Frame().AngVel(frame, derivatives).Cross(ContactPoint().PosFrom(center));
        const auto [longitudinal, lateral] = Ground().TangentVectors();
        ctx.AddNonholonomicConstraint(contact_velocity.Dot(longitudinal));
        ctx.AddNonholonomicConstraint(contact_velocity.Dot(lateral));
    }
};

} // namespace models
} // namespace cadence
