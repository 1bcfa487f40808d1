#pragma once

/**
 * @file GroundBase.hpp
 * @brief Abstract ground model
 *
 * A ground owns the inertial frame and its fixed origin, the gravity
 * constant, and the geometry tyres need to place contact points on its
 * surface.
 */

#include <cadence/core/DefinitionContext.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/core/ModelBase.hpp>

#include <string>
#include <utility>
#include <vector>

namespace cadence {
namespace models {

class GroundBase : public ModelBase {
  public:
    explicit GroundBase(std::string name)
        : ModelBase(std::move(name)), surface_(DeclareInterface("surface")) {}

    static std::vector<std::string> TypeFamilies() { return {"GroundBase"}; }

    [[nodiscard]] std::vector<std::string> Families() const override {
        return {TypeName(), "GroundBase"};
    }

    // =========================================================================
    // Objects (available after the objects stage)
    // =========================================================================

    [[nodiscard]] ReferenceFrame &Frame() const {
        RequireObjects("frame");
        return *frame_;
    }

    [[nodiscard]] Point &Origin() const {
        RequireObjects("origin");
        return *origin_;
    }

    /// Gravitational acceleration constant "g"
    [[nodiscard]] const SymbolicScalar &Gravity() const {
        RequireObjects("gravity");
        return gravity_;
    }

    // =========================================================================
    // Surface geometry
    // =========================================================================

    /// Unit normal pointing out of the ground (against gravity)
    [[nodiscard]] virtual Vector Normal() const = 0;

    /// Orthonormal pair spanning the tangent plane
    [[nodiscard]] virtual std::pair<Vector, Vector> TangentVectors() const = 0;

    /// Locate @p point on the surface at planar coordinates (x, y)
    virtual void SetPointPos(Point &point, const SymbolicScalar &x,
                             const SymbolicScalar &y) const = 0;

  protected:
    void DefineObjects(DefinitionContext &ctx) override {
        frame_ = &ctx.NewFrame("frame");
        origin_ = &ctx.NewPoint("origin");
        gravity_ = ctx.Constant("g", "gravitational acceleration");
        ctx.SetInertialFrame(*frame_, *origin_);
        ctx.BindInterface(surface_, *origin_, *frame_);
    }

    void RequireObjects(const char *what) const {
        if (frame_ == nullptr) {
            throw NotReadyError(std::string(what) + " of ground '" + Path() +
                                "' is not available before its objects stage");
        }
    }

  private:
    Interface &surface_;
    ReferenceFrame *frame_ = nullptr;
    Point *origin_ = nullptr;
    SymbolicScalar gravity_;
};

} // namespace models
} // namespace cadence
