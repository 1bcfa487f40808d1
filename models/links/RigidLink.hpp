#pragma once

/**
 * @file RigidLink.hpp
 * @brief Slender rigid segment (frame tube, fork, rider limb)
 *
 * The link lies along the x axis of its body frame, from the "proximal"
 * end to the "distal" end, with its mass center halfway. Both interfaces
 * carry the body frame.
 */

#include <cadence/core/DefinitionContext.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/core/ModelBase.hpp>

#include <string>
#include <vector>

namespace cadence {
namespace models {

class RigidLink : public ModelBase {
  public:
    explicit RigidLink(std::string name)
        : ModelBase(std::move(name)), proximal_(DeclareInterface("proximal")),
          distal_(DeclareInterface("distal")) {}

    static std::vector<std::string> TypeFamilies() { return {}; }

    [[nodiscard]] std::string TypeName() const override { return "RigidLink"; }

    [[nodiscard]] RigidBody &Body() const {
        RequireObjects("body");
        return *body_;
    }

    [[nodiscard]] const SymbolicScalar &Length() const {
        RequireObjects("length");
        return length_;
    }

  protected:
    void DefineObjects(DefinitionContext &ctx) override {
        length_ = ctx.Constant("l", "link length");
        SymbolicScalar m = ctx.Constant("m", "link mass");
        SymbolicScalar ixx = ctx.Constant("ixx", "link moment of inertia about its axis");
        SymbolicScalar iyy = ctx.Constant("iyy", "link moment of inertia about body y");
        SymbolicScalar izz = ctx.Constant("izz", "link moment of inertia about body z");
        body_ = &ctx.NewRigidBody("body", m, RigidBody::Inertia(ixx, iyy, izz));

        proximal_point_ = &ctx.NewPoint("proximal");
        distal_point_ = &ctx.NewPoint("distal");
        ctx.BindInterface(proximal_, *proximal_point_, *body_->frame);
        ctx.BindInterface(distal_, *distal_point_, *body_->frame);
    }

    void DefineKinematics(DefinitionContext & /*ctx*/) override {
        const Vector axis = body_->frame->X();
        body_->masscenter->SetPos(*proximal_point_, axis * (length_ / 2.0));
        distal_point_->SetPos(*proximal_point_, axis * length_);
    }

  private:
    void RequireObjects(const char *what) const {
        if (body_ == nullptr) {
            throw NotReadyError(std::string(what) + " of link '" + Path() +
                                "' is not available before its objects stage");
        }
    }

    Interface &proximal_;
    Interface &distal_;
    RigidBody *body_ = nullptr;
    Point *proximal_point_ = nullptr;
    Point *distal_point_ = nullptr;
    SymbolicScalar length_;
};

} // namespace models
} // namespace cadence
