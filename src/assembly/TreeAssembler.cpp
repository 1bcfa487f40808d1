/**
 * @file TreeAssembler.cpp
 * @brief Staged lifecycle traversal
 */

#include <cadence/assembly/TreeAssembler.hpp>

#include <cadence/core/ConnectionBase.hpp>
#include <cadence/core/DefinitionContext.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/core/ErrorLogging.hpp>
#include <cadence/core/ModelBase.hpp>
#include <cadence/io/LogService.hpp>
#include <cadence/symbolic/SymbolRegistry.hpp>

namespace cadence {

namespace {

/// Clears the root's running-stage marker on every exit path
class RunningStageGuard {
  public:
    RunningStageGuard(std::optional<DefinitionStage> &marker, DefinitionStage stage)
        : marker_(marker) {
        marker_ = stage;
    }
    ~RunningStageGuard() { marker_.reset(); }

    RunningStageGuard(const RunningStageGuard &) = delete;
    RunningStageGuard &operator=(const RunningStageGuard &) = delete;

  private:
    std::optional<DefinitionStage> &marker_;
};

} // namespace

void TreeAssembler::Run() {
    CADENCE_LOG_INFO("Defining model tree '" + root_.Name() + "'");
    // Sub-model roles are fixed before any hook runs; connection roles may be
    // filled by the connections stage itself
    ValidateRequirements(root_, RequirementKind::Model);
    for (DefinitionStage stage : kStages) {
        RunStage(stage);
        if (stage == DefinitionStage::ConnectionsDefined) {
            ValidateRequirements(root_, RequirementKind::Connection);
        }
    }
    CADENCE_LOG_INFO("Model tree '" + root_.Name() + "' defined: " +
                     std::to_string(registry_.OfKind(SymbolKind::Coordinate).size()) +
                     " coordinates, " +
                     std::to_string(registry_.OfKind(SymbolKind::Speed).size()) + " speeds, " +
                     std::to_string(registry_.Size()) + " symbols");
}

void TreeAssembler::RunStage(DefinitionStage stage) {
    CADENCE_LOG_DEBUG(std::string("Stage '") + StageName(stage) + "'");
    RunningStageGuard guard(root_.running_stage_, stage);
    Visit(root_, stage);
}

void TreeAssembler::Visit(ModelBase &model, DefinitionStage stage) {
    for (auto &child : model.children_) {
        Visit(*child.model, stage);
    }
    Invoke(model, stage);
    // Index loop: the connections stage may register further connections
    for (std::size_t i = 0; i < model.connections_.size(); ++i) {
        Invoke(*model.connections_[i].connection, stage);
    }
}

void TreeAssembler::CheckPreconditions(const Definable &node, DefinitionStage stage) const {
    if (node.stage_ != PreviousStage(stage)) {
        throw DefinitionError(std::string("stage '") + StageName(stage) +
                              "' requires the node to be at stage '" +
                              StageName(PreviousStage(stage)) + "', found '" +
                              StageName(node.stage_) + "'");
    }
    if (node.Kind() == NodeKind::Model) {
        const auto &model = static_cast<const ModelBase &>(node);
        for (const auto &child : model.Children()) {
            if (child.model->Stage() < stage) {
                throw DefinitionError("child '" + child.model->Name() +
                                      "' has not completed stage '" + StageName(stage) + "'");
            }
        }
    } else {
        const auto &connection = static_cast<const ConnectionBase &>(node);
        for (const Interface *interface : connection.Interfaces()) {
            if (interface->Owner().Stage() < stage) {
                throw DefinitionError("owner of interface '" + interface->Path() +
                                      "' has not completed stage '" + StageName(stage) + "'");
            }
        }
    }
}

void TreeAssembler::Invoke(Definable &node, DefinitionStage stage) {
    const std::string path = node.Path();
    LogContextManager::ScopedContext log_context(path, StageName(stage), node.TypeName());
    CADENCE_LOG_TRACE(std::string("Running '") + StageName(stage) + "' on '" + path + "'");

    try {
        CheckPreconditions(node, stage);
        DefinitionContext ctx(node, root_, registry_, stage);
        switch (stage) {
        case DefinitionStage::ConnectionsDefined:
            node.DefineConnections(ctx);
            break;
        case DefinitionStage::ObjectsDefined:
            node.DefineObjects(ctx);
            break;
        case DefinitionStage::KinematicsDefined:
            node.DefineKinematics(ctx);
            break;
        case DefinitionStage::LoadsDefined:
            node.DefineLoads(ctx);
            break;
        case DefinitionStage::ConstraintsDefined:
            node.DefineConstraints(ctx);
            break;
        case DefinitionStage::Uninitialized:
            throw DefinitionError("cannot run the 'uninitialized' stage");
        }
    } catch (Error &e) {
        e.AnnotateNode(path, StageName(stage));
        LogError(e);
        throw;
    } catch (const std::exception &e) {
        DefinitionError wrapped(path, StageName(stage), e.what());
        LogError(wrapped);
        throw wrapped;
    }
    node.stage_ = stage;
}

void TreeAssembler::ValidateRequirements(ModelBase &model, RequirementKind kind) const {
    for (auto &child : model.children_) {
        ValidateRequirements(*child.model, kind);
    }
    for (const auto &requirement : model.Requirements()) {
        if (!requirement.Hard() || requirement.Kind() != kind) {
            continue;
        }
        bool present = kind == RequirementKind::Model
                           ? model.HasSubModel(requirement.AttributeName())
                           : model.HasConnection(requirement.AttributeName());
        if (!present) {
            StructuralError error("missing required " + requirement.FullName() + " ('" +
                                  requirement.AttributeName() + "', " + requirement.TypeName() +
                                  ")");
            error.AnnotateNode(model.Path(), StageName(kind == RequirementKind::Model
                                                           ? DefinitionStage::Uninitialized
                                                           : DefinitionStage::ConnectionsDefined));
            LogError(error);
            throw error;
        }
    }
}

} // namespace cadence
