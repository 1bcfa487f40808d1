#pragma once

/**
 * @file FlatGround.hpp
 * @brief Flat horizontal ground plane
 *
 * Options:
 *   strings.normal  Direction of the surface normal in the ground frame,
 *                   "-z" (default, z axis pointing down) or "+z"
 */

#include <cadence/core/Error.hpp>

#include <grounds/GroundBase.hpp>

#include <string>
#include <utility>

namespace cadence {
namespace models {

class FlatGround : public GroundBase {
  public:
    explicit FlatGround(std::string name) : GroundBase(std::move(name)) {}

    [[nodiscard]] std::string TypeName() const override { return "FlatGround"; }

    [[nodiscard]] Vector Normal() const override {
        return Frame().Z() * SymbolicScalar(normal_sign_);
    }

    [[nodiscard]] std::pair<Vector, Vector> TangentVectors() const override {
        return {Frame().X(), Frame().Y()};
    }

    void SetPointPos(Point &point, const SymbolicScalar &x,
                     const SymbolicScalar &y) const override {
        point.SetPos(Origin(), Frame().X() * x + Frame().Y() * y);
    }

  protected:
    void DefineObjects(DefinitionContext &ctx) override {
        normal_sign_ = ParseNormal();
        GroundBase::DefineObjects(ctx);
    }

  private:
    /// +1 for a "+z" normal, -1 for "-z"
    [[nodiscard]] double ParseNormal() const {
        const std::string normal = Options().Get<std::string>("normal", "-z");
        if (normal == "-z") {
            return -1.0;
        }
        if (normal == "+z" || normal == "z") {
            return 1.0;
        }
        throw ConfigError("FlatGround '" + Path() + "': normal must be '+z' or '-z', got '" +
                          normal + "'");
    }

    double normal_sign_ = -1.0;
};

} // namespace models
} // namespace cadence
