#pragma once

/**
 * @file TreeAssembler.hpp
 * @brief Drives the staged definition lifecycle over a model tree
 *
 * Stages run one at a time over the whole tree, never interleaved. Within a
 * stage the order is post-order depth first in attachment order: every
 * child subtree, then the node's own hook, then the node's connections in
 * registration order. Connections registered by a hook during the
 * connections stage are picked up in the same pass.
 */

#include <cadence/core/CoreTypes.hpp>
#include <cadence/core/Requirement.hpp>

#include <array>

namespace cadence {

class Definable;
class ModelBase;
class SymbolRegistry;

class TreeAssembler {
  public:
    /// Stages in execution order
    static constexpr std::array<DefinitionStage, 5> kStages = {
        DefinitionStage::ConnectionsDefined, DefinitionStage::ObjectsDefined,
        DefinitionStage::KinematicsDefined, DefinitionStage::LoadsDefined,
        DefinitionStage::ConstraintsDefined};

    TreeAssembler(ModelBase &root, SymbolRegistry &registry) : root_(root), registry_(registry) {}

    /**
     * @brief Run every stage over the tree
     *
     * Hard sub-model requirements are checked before the first stage, hard
     * connection requirements right after the connections stage. Errors are
     * annotated with the offending node path and stage, logged
     * and rethrown with their original type; foreign exceptions are wrapped
     * in DefinitionError.
     */
    void Run();

    /// Run a single stage over the whole tree
    void RunStage(DefinitionStage stage);

  private:
    void Visit(ModelBase &model, DefinitionStage stage);
    void Invoke(Definable &node, DefinitionStage stage);
    void CheckPreconditions(const Definable &node, DefinitionStage stage) const;
    void ValidateRequirements(ModelBase &model, RequirementKind kind) const;

    ModelBase &root_;
    SymbolRegistry &registry_;
};

} // namespace cadence
