#pragma once

/**
 * @file WheelBase.hpp
 * @brief Abstract wheel model
 *
 * A wheel is a rigid body spinning about the y axis of its body frame. It
 * exposes its center and body frame through the "hub" interface.
 */

#include <cadence/core/DefinitionContext.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/core/ModelBase.hpp>

#include <optional>
#include <string>
#include <vector>

namespace cadence {
namespace models {

class WheelBase : public ModelBase {
  public:
    explicit WheelBase(std::string name)
        : ModelBase(std::move(name)), hub_(DeclareInterface("hub")) {}

    static std::vector<std::string> TypeFamilies() { return {"WheelBase"}; }

    [[nodiscard]] std::vector<std::string> Families() const override {
        return {TypeName(), "WheelBase"};
    }

    [[nodiscard]] RigidBody &Body() const {
        RequireObjects("body");
        return *body_;
    }

    [[nodiscard]] ReferenceFrame &Frame() const { return *Body().frame; }
    [[nodiscard]] Point &Center() const { return *Body().masscenter; }

    [[nodiscard]] const SymbolicScalar &Radius() const {
        RequireObjects("radius");
        return radius_;
    }

    /// Spin axis (body y axis)
    [[nodiscard]] Vector RotationAxis() const { return Frame().Y(); }

    /// Tube radius of a toroidal tyre; empty for a knife-edge contact
    [[nodiscard]] virtual std::optional<SymbolicScalar> TubeRadius() const {
        return std::nullopt;
    }

  protected:
    /// Create the wheel body and bind the hub; called by concrete wheels
    void CreateWheel(DefinitionContext &ctx, const SymbolicScalar &radius,
                     const SymbolicScalar &mass, const SymbolicScalar &inertia) {
        radius_ = radius;
        body_ = &ctx.NewRigidBody("body", mass, inertia);
        ctx.BindInterface(hub_, *body_->masscenter, *body_->frame);
    }

  private:
    void RequireObjects(const char *what) const {
        if (body_ == nullptr) {
            throw NotReadyError(std::string(what) + " of wheel '" + Path() +
                                "' is not available before its objects stage");
        }
    }

    Interface &hub_;
    RigidBody *body_ = nullptr;
    SymbolicScalar radius_;
};

} // namespace models
} // namespace cadence
