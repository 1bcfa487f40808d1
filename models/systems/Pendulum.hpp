#pragma once

/**
 * @file Pendulum.hpp
 * @brief Compound pendulum: a rigid link hinged to the ground
 *
 * Children: "ground" (GroundBase) and "link" (RigidLink). Connection:
 * "joint" (JointBase), a revolute joint about the ground y axis at the
 * link's proximal end is created when none was registered.
 */

#include <cadence/core/DefinitionContext.hpp>
#include <cadence/core/ModelBase.hpp>
#include <cadence/core/Requirement.hpp>

#include <grounds/GroundBase.hpp>
#include <joints/RevoluteJoint.hpp>
#include <links/RigidLink.hpp>

#include <memory>
#include <string>
#include <vector>

namespace cadence {
namespace models {

class Pendulum : public ModelBase {
  public:
    explicit Pendulum(std::string name) : ModelBase(std::move(name)) {
        DeclareRequirement(Requirement("ground", {"GroundBase"}, "Ground model.", true));
        DeclareRequirement(Requirement("link", {"RigidLink"}, "Swinging link.", true));
        DeclareRequirement(
            Requirement::Connection("joint", {"JointBase"}, "Hinge at the pivot.", true));
    }

    static std::vector<std::string> TypeFamilies() { return {}; }

    [[nodiscard]] std::string TypeName() const override { return "Pendulum"; }

    [[nodiscard]] GroundBase &Ground() const { return GetSubModel<GroundBase>("ground"); }
    [[nodiscard]] RigidLink &Link() const { return GetSubModel<RigidLink>("link"); }

  protected:
    void DefineConnections(DefinitionContext & /*ctx*/) override {
        if (HasConnection("joint")) {
            return;
        }
        std::vector<Interface *> interfaces{&Ground().GetInterface("surface"),
                                            &Link().GetInterface("proximal")};
        AddConnection("joint", std::make_unique<RevoluteJoint>("joint", interfaces, Axis::Y));
    }

    void DefineLoads(DefinitionContext &ctx) override {
        ApplyUniformGravity(ctx, Ground().Gravity(), -Ground().Normal());
    }
};

} // namespace models
} // namespace cadence
