/**
 * @file AggregatedSystem.cpp
 * @brief Depth-first aggregation of a defined tree
 */

#include <cadence/assembly/AggregatedSystem.hpp>

#include <cadence/core/ConnectionBase.hpp>
#include <cadence/core/ModelBase.hpp>
#include <cadence/io/LogService.hpp>

#include <functional>

namespace cadence {

namespace {

void Collect(const Definable &node, std::vector<const RigidBody *> &bodies,
             std::vector<Load> &loads, std::vector<Equation> &kdes,
             std::vector<Equation> &holonomic, std::vector<Equation> &nonholonomic,
             std::vector<SymbolicScalar> &dependent) {
    for (const auto &body : node.Bodies()) {
        bodies.push_back(body.get());
    }
    loads.insert(loads.end(), node.Loads().begin(), node.Loads().end());
    kdes.insert(kdes.end(), node.KinematicEquations().begin(), node.KinematicEquations().end());
    holonomic.insert(holonomic.end(), node.HolonomicConstraints().begin(),
                     node.HolonomicConstraints().end());
    nonholonomic.insert(nonholonomic.end(), node.NonholonomicConstraints().begin(),
                        node.NonholonomicConstraints().end());
    dependent.insert(dependent.end(), node.DependentSpeeds().begin(),
                     node.DependentSpeeds().end());
}

} // namespace

SolverError::Ownership AggregatedSystem::OwnershipTable() const {
    SolverError::Ownership table;
    for (const Symbol *q : coordinates_) {
        table.emplace_back(q->identifier, q->owner_path);
    }
    for (const Symbol *u : speeds_) {
        table.emplace_back(u->identifier, u->owner_path);
    }
    return table;
}

AggregatedSystem Aggregate(ModelBase &root) {
    if (root.Parent() != nullptr) {
        throw StructuralError("Aggregate() needs the root model, '" + root.Path() +
                              "' has a parent");
    }
    if (root.aggregated_) {
        throw AlreadyDefinedError("model tree '" + root.Name() + "' was already aggregated");
    }
    if (root.Stage() != DefinitionStage::ConstraintsDefined || !root.registry_) {
        throw NotReadyError("model tree '" + root.Name() +
                            "' must complete DefineAll() before aggregation");
    }

    AggregatedSystem system;

    std::function<void(const ModelBase &)> visit = [&](const ModelBase &model) {
        Collect(model, system.bodies_, system.loads_, system.kdes_, system.holonomic_,
                system.nonholonomic_, system.dependent_speeds_);
        for (const auto &child : model.Children()) {
            visit(*child.model);
        }
        for (const auto &slot : model.Connections()) {
            Collect(*slot.connection, system.bodies_, system.loads_, system.kdes_,
                    system.holonomic_, system.nonholonomic_, system.dependent_speeds_);
        }
    };
    visit(root);

    system.registry_ = std::move(root.registry_);
    system.coordinates_ = system.registry_->OfKind(SymbolKind::Coordinate);
    system.speeds_ = system.registry_->OfKind(SymbolKind::Speed);
    system.constants_ = system.registry_->OfKind(SymbolKind::Constant);
    system.auxiliaries_ = system.registry_->OfKind(SymbolKind::Auxiliary);
    system.inertial_frame_ = root.inertial_frame_;
    system.inertial_origin_ = root.inertial_origin_;
    root.aggregated_ = true;

    CADENCE_LOG_DEBUG("Aggregated '" + root.Name() + "': " +
                      std::to_string(system.bodies_.size()) + " bodies, " +
                      std::to_string(system.loads_.size()) + " loads, " +
                      std::to_string(system.kdes_.size()) + " kinematic equations");
    return system;
}

} // namespace cadence
