#pragma once

/**
 * @file WeldJoint.hpp
 * @brief Rigid attachment (seat post, handlebar clamp)
 *
 * Aligns the child frame with the parent frame and makes the two interface
 * points coincide. Adds no symbols.
 */

#include <cadence/core/DefinitionContext.hpp>

#include <joints/JointBase.hpp>

#include <string>
#include <vector>

namespace cadence {
namespace models {

class WeldJoint : public JointBase {
  public:
    WeldJoint(std::string name, std::vector<Interface *> interfaces)
        : JointBase(std::move(name), std::move(interfaces)) {}

    [[nodiscard]] std::string TypeName() const override { return "WeldJoint"; }

  protected:
    void DefineKinematics(DefinitionContext & /*ctx*/) override {
        MutableFrame(1).Fix(MutableFrame(0));
        MutablePoint(1).SetPos(MutablePoint(0), Vector());
    }
};

} // namespace models
} // namespace cadence
