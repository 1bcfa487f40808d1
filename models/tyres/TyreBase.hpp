#pragma once

/**
 * @file TyreBase.hpp
 * @brief Abstract tyre connecting a wheel to the ground
 *
 * Interface 0 must be a ground's "surface", interface 1 a wheel's "hub".
 * The tyre owns the contact point; the parent model (or a later
 * connection) locates it on the ground.
 *
 * The wheel center sits at contact + r * e + tr * n, with n the ground
 * normal, e the upward radial axis of the wheel and tr the tube radius of a
 * toroidal wheel. By default e = unit(n - a (a . n)) for spin axis a; a
 * parent model may supply e directly with SetUpwardRadialAxis() to avoid
 * the normalization.
 */

#include <cadence/core/ConnectionBase.hpp>
#include <cadence/core/DefinitionContext.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/symbolic/Algebra.hpp>

#include <grounds/GroundBase.hpp>
#include <wheels/WheelBase.hpp>

#include <optional>
#include <string>
#include <vector>

namespace cadence {
namespace models {

class TyreBase : public ConnectionBase {
  public:
    TyreBase(std::string name, std::vector<Interface *> interfaces)
        : ConnectionBase(std::move(name), std::move(interfaces)) {
        if (Interfaces().size() != 2 || Interfaces()[0] == nullptr ||
            Interfaces()[1] == nullptr) {
            throw StructuralError("tyre '" + Name() +
                                  "' joins exactly two interfaces (ground surface, wheel hub)");
        }
        ground_ = dynamic_cast<GroundBase *>(&Interfaces()[0]->Owner());
        wheel_ = dynamic_cast<WheelBase *>(&Interfaces()[1]->Owner());
        if (ground_ == nullptr) {
            throw StructuralError("tyre '" + Name() + "': interface '" +
                                  Interfaces()[0]->Path() + "' does not belong to a ground");
        }
        if (wheel_ == nullptr) {
            throw StructuralError("tyre '" + Name() + "': interface '" +
                                  Interfaces()[1]->Path() + "' does not belong to a wheel");
        }
    }

    static std::vector<std::string> TypeFamilies() { return {"TyreBase"}; }

    [[nodiscard]] std::vector<std::string> Families() const override {
        return {TypeName(), "TyreBase"};
    }

    [[nodiscard]] GroundBase &Ground() const { return *ground_; }
    [[nodiscard]] WheelBase &Wheel() const { return *wheel_; }

    /**
     * @brief Use @p axis as the upward radial axis of the wheel
     *
     * Checked when the wheel center is placed: it must be a unit vector
     * normal to the spin axis, in the plane of the spin axis and the ground
     * normal. Set it before the tyre's kinematics stage.
     */
    void SetUpwardRadialAxis(const Vector &axis) { upward_radial_axis_ = axis; }

    [[nodiscard]] const std::optional<Vector> &UpwardRadialAxis() const {
        return upward_radial_axis_;
    }

    [[nodiscard]] Point &ContactPoint() const {
        if (contact_point_ == nullptr) {
            throw NotReadyError("contact point of tyre '" + Path() +
                                "' is not available before its objects stage");
        }
        return *contact_point_;
    }

  protected:
    void DefineObjects(DefinitionContext &ctx) override {
        contact_point_ = &ctx.NewPoint("contact_point");
    }

    /**
     * @brief Place the wheel center above the contact point
     * @throws ConfigError if the upward radial axis fails its checks
     */
    void SetWheelCenterPos() const {
        const Vector normal = ground_->Normal();
        const Vector axis = wheel_->RotationAxis();

        Vector upward;
        if (upward_radial_axis_) {
            upward = *upward_radial_axis_;
            CheckUpwardRadialAxis(upward, normal, axis);
        } else {
            const Vector radial = normal - axis * axis.Dot(normal);
            upward = radial * (1.0 / radial.Magnitude());
        }

        Vector offset = upward * wheel_->Radius();
        if (const auto tube_radius = wheel_->TubeRadius()) {
            offset += normal * *tube_radius;
        }
        MutablePoint(1).SetPos(ContactPoint(), offset);
    }

  private:
    void CheckUpwardRadialAxis(const Vector &upward, const Vector &normal,
                               const Vector &axis) const {
        const std::string prefix = "tyre '" + Path() + "': upward radial axis ";
        if (upward.IsZero() || !algebra::IsZeroAt(upward.Dot(upward) - 1.0)) {
            throw ConfigError(prefix + "must be a unit vector");
        }
        if (!algebra::IsZeroAt(upward.Dot(axis))) {
            throw ConfigError(prefix + "must be normal to the wheel's rotation axis");
        }
        if (!algebra::IsZeroAt(upward.Dot(axis.Cross(normal)))) {
            throw ConfigError(prefix + "must lie in the plane of the rotation axis and the "
                                       "ground normal");
        }
    }

    GroundBase *ground_ = nullptr;
    WheelBase *wheel_ = nullptr;
    Point *contact_point_ = nullptr;
    std::optional<Vector> upward_radial_axis_;
};

} // namespace models
} // namespace cadence
