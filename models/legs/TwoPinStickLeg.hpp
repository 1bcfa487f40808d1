#pragma once

/**
 * @file TwoPinStickLeg.hpp
 * @brief Rider leg of three stick segments joined by knee and ankle pins
 *
 * Children: "thigh", "shank" and "foot" (RigidLink), each lying along its
 * own x axis. Connections: "knee" between the thigh's distal and the
 * shank's proximal end, and "ankle" between the shank's distal and the
 * foot's proximal end (JointBase). Revolute joints about the segment y axis
 * are created when none were registered.
 *
 * Interfaces: "hip" forwards the thigh's proximal end (attach it to the
 * pelvis) and "foot" forwards the foot's distal end (attach it to a pedal).
 */

#include <cadence/core/DefinitionContext.hpp>
#include <cadence/core/ModelBase.hpp>
#include <cadence/core/Requirement.hpp>

#include <joints/RevoluteJoint.hpp>
#include <links/RigidLink.hpp>

#include <memory>
#include <string>
#include <vector>

namespace cadence {
namespace models {

class TwoPinStickLeg : public ModelBase {
  public:
    explicit TwoPinStickLeg(std::string name)
        : ModelBase(std::move(name)), hip_(DeclareInterface("hip")),
          foot_(DeclareInterface("foot")) {
        DeclareRequirement(Requirement("thigh", {"RigidLink"}, "Thigh segment.", true));
        DeclareRequirement(Requirement("shank", {"RigidLink"}, "Shank segment.", true));
        DeclareRequirement(Requirement("foot", {"RigidLink"}, "Foot segment.", true));
        DeclareRequirement(Requirement::Connection("knee", {"JointBase"},
                                                   "Joint between thigh and shank.", true));
        DeclareRequirement(Requirement::Connection("ankle", {"JointBase"},
                                                   "Joint between shank and foot.", true));
    }

    static std::vector<std::string> TypeFamilies() { return {"LegBase"}; }

    [[nodiscard]] std::vector<std::string> Families() const override {
        return {TypeName(), "LegBase"};
    }

    [[nodiscard]] std::string TypeName() const override { return "TwoPinStickLeg"; }

    [[nodiscard]] RigidLink &Thigh() const { return GetSubModel<RigidLink>("thigh"); }
    [[nodiscard]] RigidLink &Shank() const { return GetSubModel<RigidLink>("shank"); }
    [[nodiscard]] RigidLink &Foot() const { return GetSubModel<RigidLink>("foot"); }

  protected:
    void DefineConnections(DefinitionContext & /*ctx*/) override {
        if (!HasConnection("knee")) {
            std::vector<Interface *> knee{&Thigh().GetInterface("distal"),
                                          &Shank().GetInterface("proximal")};
            AddConnection("knee", std::make_unique<RevoluteJoint>("knee", knee, Axis::Y));
        }
        if (!HasConnection("ankle")) {
            std::vector<Interface *> ankle{&Shank().GetInterface("distal"),
                                           &Foot().GetInterface("proximal")};
            AddConnection("ankle", std::make_unique<RevoluteJoint>("ankle", ankle, Axis::Y));
        }
    }

    void DefineObjects(DefinitionContext &ctx) override {
        ctx.ForwardInterface(hip_, Thigh().GetInterface("proximal"));
        ctx.ForwardInterface(foot_, Foot().GetInterface("distal"));
    }

  private:
    Interface &hip_;
    Interface &foot_;
};

} // namespace models
} // namespace cadence
