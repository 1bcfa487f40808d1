#pragma once

/**
 * @file RollingDisc.hpp
 * @brief Disc rolling without slip on a ground plane
 *
 * Children: "disc" (WheelBase) and "ground" (GroundBase). Connection:
 * "tyre" (TyreBase), a NonHolonomicTyre is created during the connections
 * stage when none was registered.
 *
 * Coordinates: q1, q2 locate the contact point on the ground, q3 (yaw about
 * the ground z axis), q4 (roll about the yawed x axis) and q5 (spin about
 * the rolled y axis) orient the disc. The speeds u1..u5 are the coordinate
 * rates; u1 and u2 are dependent.
 */

#include <cadence/core/DefinitionContext.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/core/ModelBase.hpp>
#include <cadence/core/Requirement.hpp>

#include <grounds/GroundBase.hpp>
#include <tyres/NonHolonomicTyre.hpp>
#include <tyres/TyreBase.hpp>
#include <wheels/WheelBase.hpp>

#include <array>
#include <memory>
#include <string>
#include <vector>

namespace cadence {
namespace models {

class RollingDisc : public ModelBase {
  public:
    static constexpr std::size_t kNumCoordinates = 5;

    explicit RollingDisc(std::string name) : ModelBase(std::move(name)) {
        DeclareRequirement(Requirement("disc", {"WheelBase"}, "Disc model.", true));
        DeclareRequirement(Requirement("ground", {"GroundBase"}, "Ground model.", true));
        DeclareRequirement(Requirement::Connection("tyre", {"TyreBase"},
                                                   "Tyre model connecting disc and ground.",
                                                   true));
    }

    static std::vector<std::string> TypeFamilies() { return {}; }

    [[nodiscard]] std::string TypeName() const override { return "RollingDisc"; }

    [[nodiscard]] WheelBase &Disc() const { return GetSubModel<WheelBase>("disc"); }
    [[nodiscard]] GroundBase &Ground() const { return GetSubModel<GroundBase>("ground"); }
    [[nodiscard]] TyreBase &Tyre() const;

    /// q1..q5 (after the objects stage)
    [[nodiscard]] const std::array<const Symbol *, kNumCoordinates> &Coordinates() const {
        return q_;
    }

    /// u1..u5 (after the objects stage)
    [[nodiscard]] const std::array<const Symbol *, kNumCoordinates> &Speeds() const {
        return u_;
    }

  protected:
    void DefineConnections(DefinitionContext & /*ctx*/) override {
        if (HasConnection("tyre")) {
            return;
        }
        std::vector<Interface *> interfaces{&Ground().GetInterface("surface"),
                                            &Disc().GetInterface("hub")};
        AddConnection("tyre", std::make_unique<NonHolonomicTyre>("tyre", interfaces));
    }

    void DefineObjects(DefinitionContext &ctx) override {
        static const std::array<const char *, kNumCoordinates> kDescriptions = {
            "perpendicular distance along ground.x to the contact point",
            "perpendicular distance along ground.y to the contact point",
            "yaw angle of the disc",
            "roll angle of the disc",
            "rotation angle of the disc",
        };
        for (std::size_t i = 0; i < kNumCoordinates; ++i) {
            const std::string index = std::to_string(i + 1);
            q_[i] = &ctx.Coordinate("q" + index, std::string(kDescriptions[i]));
            u_[i] = &ctx.Speed("u" + index,
                               std::string("generalized speed of the ") + kDescriptions[i]);
        }
        yaw_frame_ = &ctx.NewFrame("yaw_frame");
        roll_frame_ = &ctx.NewFrame("roll_frame");
    }

    void DefineKinematics(DefinitionContext &ctx) override {
        ReferenceFrame &ground_frame = Ground().Frame();
        yaw_frame_->OrientAxis(ground_frame, q_[2]->value, Axis::Z);
        roll_frame_->OrientAxis(*yaw_frame_, q_[3]->value, Axis::X);
        Disc().Frame().OrientAxis(*roll_frame_, q_[4]->value, Axis::Y);

        Ground().SetPointPos(Tyre().ContactPoint(), q_[0]->value, q_[1]->value);

        for (std::size_t i = 0; i < kNumCoordinates; ++i) {
            ctx.AddKinematicEquation(q_[i]->rate - u_[i]->value);
        }
    }

    void DefineLoads(DefinitionContext &ctx) override {
        ApplyUniformGravity(ctx, Ground().Gravity(), -Ground().Normal());
    }

    void DefineConstraints(DefinitionContext &ctx) override {
        ctx.MarkDependentSpeed(u_[0]->value);
        ctx.MarkDependentSpeed(u_[1]->value);
    }

  private:
    std::array<const Symbol *, kNumCoordinates> q_{};
    std::array<const Symbol *, kNumCoordinates> u_{};
    ReferenceFrame *yaw_frame_ = nullptr;
    ReferenceFrame *roll_frame_ = nullptr;
};

inline TyreBase &RollingDisc::Tyre() const {
    auto *tyre = dynamic_cast<TyreBase *>(&GetConnection("tyre"));
    if (tyre == nullptr) {
        throw StructuralError("connection 'tyre' of '" + Path() + "' is not a tyre");
    }
    return *tyre;
}

} // namespace models
} // namespace cadence
