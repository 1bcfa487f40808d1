#pragma once

/**
 * @file TestModels.hpp
 * @brief Minimal models and connections for lifecycle tests
 */

#include <cadence/assembly/AggregatedSystem.hpp>
#include <cadence/core/ConnectionBase.hpp>
#include <cadence/core/DefinitionContext.hpp>
#include <cadence/core/ModelBase.hpp>

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace cadence::test_models {

/// Shared record of hook invocations ("<path>:<stage>")
using CallLog = std::vector<std::string>;

/**
 * @brief Model exposing one bound interface ("port") and logging its hooks
 */
class PortModel : public ModelBase {
  public:
    explicit PortModel(std::string name, CallLog *log = nullptr)
        : ModelBase(std::move(name)), port_(DeclareInterface("port")), log_(log) {}

    [[nodiscard]] std::string TypeName() const override { return "PortModel"; }

    Interface &Port() { return port_; }

  protected:
    void DefineConnections(DefinitionContext &ctx) override { Record(ctx); }

    void DefineObjects(DefinitionContext &ctx) override {
        Record(ctx);
        ctx.BindInterface(port_, ctx.NewPoint("port_point"), ctx.NewFrame("port_frame"));
    }

    void DefineKinematics(DefinitionContext &ctx) override { Record(ctx); }
    void DefineLoads(DefinitionContext &ctx) override { Record(ctx); }
    void DefineConstraints(DefinitionContext &ctx) override { Record(ctx); }

  private:
    void Record(const DefinitionContext &ctx) {
        if (log_ != nullptr) {
            log_->push_back(ctx.Path() + ":" + StageName(ctx.Stage()));
        }
    }

    Interface &port_;
    CallLog *log_;
};

/**
 * @brief Inertial frame and fixed origin exposed through a "mount" interface
 *
 * Pins other models to the inertial frame when joined to them by a joint.
 */
class MountModel : public ModelBase {
  public:
    explicit MountModel(std::string name)
        : ModelBase(std::move(name)), mount_(DeclareInterface("mount")) {}

    [[nodiscard]] std::string TypeName() const override { return "MountModel"; }

    Interface &Mount() { return mount_; }

  protected:
    void DefineObjects(DefinitionContext &ctx) override {
        ReferenceFrame &frame = ctx.NewFrame("frame");
        Point &origin = ctx.NewPoint("origin");
        ctx.SetInertialFrame(frame, origin);
        ctx.BindInterface(mount_, origin, frame);
    }

  private:
    Interface &mount_;
};

/**
 * @brief Plain container model that only logs its hooks
 */
class GroupModel : public ModelBase {
  public:
    explicit GroupModel(std::string name, CallLog *log = nullptr)
        : ModelBase(std::move(name)), log_(log) {}

    [[nodiscard]] std::string TypeName() const override { return "GroupModel"; }

  protected:
    void DefineConnections(DefinitionContext &ctx) override { Record(ctx); }
    void DefineObjects(DefinitionContext &ctx) override { Record(ctx); }
    void DefineKinematics(DefinitionContext &ctx) override { Record(ctx); }
    void DefineLoads(DefinitionContext &ctx) override { Record(ctx); }
    void DefineConstraints(DefinitionContext &ctx) override { Record(ctx); }

  private:
    void Record(const DefinitionContext &ctx) {
        if (log_ != nullptr) {
            log_->push_back(ctx.Path() + ":" + StageName(ctx.Stage()));
        }
    }

    CallLog *log_;
};

/**
 * @brief Connection that only logs its hooks
 */
class LinkConnection : public ConnectionBase {
  public:
    LinkConnection(std::string name, std::vector<Interface *> interfaces, CallLog *log = nullptr)
        : ConnectionBase(std::move(name), std::move(interfaces)), log_(log) {}

    [[nodiscard]] std::string TypeName() const override { return "LinkConnection"; }

    using ConnectionBase::MutableFrame;
    using ConnectionBase::MutablePoint;

  protected:
    void DefineConnections(DefinitionContext &ctx) override { Record(ctx); }
    void DefineObjects(DefinitionContext &ctx) override { Record(ctx); }
    void DefineKinematics(DefinitionContext &ctx) override { Record(ctx); }
    void DefineLoads(DefinitionContext &ctx) override { Record(ctx); }
    void DefineConstraints(DefinitionContext &ctx) override { Record(ctx); }

  private:
    void Record(const DefinitionContext &ctx) {
        if (log_ != nullptr) {
            log_->push_back(ctx.Path() + ":" + StageName(ctx.Stage()));
        }
    }

    CallLog *log_;
};

/**
 * @brief Model whose stage hooks run callbacks installed by the test
 */
class ScriptedModel : public ModelBase {
  public:
    using Hook = std::function<void(DefinitionContext &)>;

    explicit ScriptedModel(std::string name) : ModelBase(std::move(name)) {}

    [[nodiscard]] std::string TypeName() const override { return "ScriptedModel"; }

    void On(DefinitionStage stage, Hook hook) { hooks_[stage] = std::move(hook); }

    using ModelBase::ApplyUniformGravity;
    using ModelBase::DeclareRequirement;

  protected:
    void DefineConnections(DefinitionContext &ctx) override {
        Run(DefinitionStage::ConnectionsDefined, ctx);
    }
    void DefineObjects(DefinitionContext &ctx) override {
        Run(DefinitionStage::ObjectsDefined, ctx);
    }
    void DefineKinematics(DefinitionContext &ctx) override {
        Run(DefinitionStage::KinematicsDefined, ctx);
    }
    void DefineLoads(DefinitionContext &ctx) override { Run(DefinitionStage::LoadsDefined, ctx); }
    void DefineConstraints(DefinitionContext &ctx) override {
        Run(DefinitionStage::ConstraintsDefined, ctx);
    }

  private:
    void Run(DefinitionStage stage, DefinitionContext &ctx) {
        auto it = hooks_.find(stage);
        if (it != hooks_.end()) {
            it->second(ctx);
        }
    }

    std::map<DefinitionStage, Hook> hooks_;
};

/**
 * @brief Numeric parameter vector (constants, then auxiliaries) by identifier
 * @throws std::out_of_range if a symbol has no value in @p values
 */
inline NumericVector ParameterValues(const AggregatedSystem &system,
                                     const std::map<std::string, double> &values) {
    NumericVector p(static_cast<Eigen::Index>(system.Constants().size() +
                                              system.Auxiliaries().size()));
    Eigen::Index i = 0;
    for (const Symbol *s : system.Constants()) {
        p(i++) = values.at(s->identifier);
    }
    for (const Symbol *s : system.Auxiliaries()) {
        p(i++) = values.at(s->identifier);
    }
    return p;
}

} // namespace cadence::test_models
