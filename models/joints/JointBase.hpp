#pragma once

/**
 * @file JointBase.hpp
 * @brief Abstract two-interface joint
 *
 * Interface 0 is the parent side, interface 1 the child side. Joints move
 * the child interface's frame and point relative to the parent's.
 */

#include <cadence/core/ConnectionBase.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/symbolic/ReferenceFrame.hpp>

#include <string>
#include <vector>

namespace cadence {
namespace models {

class JointBase : public ConnectionBase {
  public:
    JointBase(std::string name, std::vector<Interface *> interfaces)
        : ConnectionBase(std::move(name), std::move(interfaces)) {
        if (Interfaces().size() != 2) {
            throw StructuralError("joint '" + Name() + "' joins exactly two interfaces, got " +
                                  std::to_string(Interfaces().size()));
        }
    }

    static std::vector<std::string> TypeFamilies() { return {"JointBase"}; }

    [[nodiscard]] std::vector<std::string> Families() const override {
        return {TypeName(), "JointBase"};
    }

    [[nodiscard]] Interface &ParentInterface() const { return GetInterface(0); }
    [[nodiscard]] Interface &ChildInterface() const { return GetInterface(1); }

    /**
     * @brief Parse "x", "y" or "z" (case-insensitive)
     * @throws ConfigError for anything else
     */
    static Axis ParseAxis(const std::string &text, const std::string &owner) {
        if (text == "x" || text == "X") {
            return Axis::X;
        }
        if (text == "y" || text == "Y") {
            return Axis::Y;
        }
        if (text == "z" || text == "Z") {
            return Axis::Z;
        }
        throw ConfigError("Joint '" + owner + "': axis must be x, y or z, got '" + text + "'");
    }

    static const char *AxisName(Axis axis) {
        switch (axis) {
        case Axis::X:
            return "x";
        case Axis::Y:
            return "y";
        case Axis::Z:
            return "z";
        }
        return "z";
    }
};

} // namespace models
} // namespace cadence
