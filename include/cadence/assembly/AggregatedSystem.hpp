#pragma once

/**
 * @file AggregatedSystem.hpp
 * @brief Merged content of a fully defined model tree
 *
 * Built once per root by Aggregate() and immutable afterwards. The system
 * takes over the symbol registry of the definition run; bodies and loads
 * still refer to frames and points owned by the tree, so the tree must
 * outlive the system.
 */

#include <cadence/core/Error.hpp>
#include <cadence/symbolic/RigidBody.hpp>
#include <cadence/symbolic/SymbolRegistry.hpp>

#include <memory>
#include <vector>

namespace cadence {

class ModelBase;

class AggregatedSystem {
  public:
    AggregatedSystem(AggregatedSystem &&) = default;
    AggregatedSystem &operator=(AggregatedSystem &&) = default;

    [[nodiscard]] const std::vector<const RigidBody *> &Bodies() const { return bodies_; }
    [[nodiscard]] const std::vector<Load> &Loads() const { return loads_; }
    [[nodiscard]] const std::vector<Equation> &KinematicEquations() const { return kdes_; }
    [[nodiscard]] const std::vector<Equation> &HolonomicConstraints() const {
        return holonomic_;
    }
    [[nodiscard]] const std::vector<Equation> &NonholonomicConstraints() const {
        return nonholonomic_;
    }
    [[nodiscard]] const std::vector<SymbolicScalar> &DependentSpeeds() const {
        return dependent_speeds_;
    }

    /// Generalized coordinates in creation order
    [[nodiscard]] const std::vector<const Symbol *> &Coordinates() const { return coordinates_; }
    /// Generalized speeds in creation order
    [[nodiscard]] const std::vector<const Symbol *> &Speeds() const { return speeds_; }
    [[nodiscard]] const std::vector<const Symbol *> &Constants() const { return constants_; }
    [[nodiscard]] const std::vector<const Symbol *> &Auxiliaries() const { return auxiliaries_; }

    [[nodiscard]] const SymbolRegistry &Registry() const { return *registry_; }
    [[nodiscard]] const TimeDerivative &Derivatives() const { return registry_->Derivatives(); }

    /// Inertial frame declared during definition (nullptr if none)
    [[nodiscard]] const ReferenceFrame *InertialFrame() const { return inertial_frame_; }
    [[nodiscard]] const Point *InertialOrigin() const { return inertial_origin_; }

    /// Coordinate and speed identifiers with the node that created each
    [[nodiscard]] SolverError::Ownership OwnershipTable() const;

  private:
    AggregatedSystem() = default;

    friend AggregatedSystem Aggregate(ModelBase &root);

    std::vector<const RigidBody *> bodies_;
    std::vector<Load> loads_;
    std::vector<Equation> kdes_;
    std::vector<Equation> holonomic_;
    std::vector<Equation> nonholonomic_;
    std::vector<SymbolicScalar> dependent_speeds_;

    std::vector<const Symbol *> coordinates_;
    std::vector<const Symbol *> speeds_;
    std::vector<const Symbol *> constants_;
    std::vector<const Symbol *> auxiliaries_;

    std::unique_ptr<SymbolRegistry> registry_;
    const ReferenceFrame *inertial_frame_ = nullptr;
    const Point *inertial_origin_ = nullptr;
};

/**
 * @brief Merge a defined tree into one system
 *
 * Depth-first in attachment order: a node's own content, then its
 * children, then its connections. No deduplication is performed.
 *
 * @throws StructuralError if @p root is not a root model
 * @throws NotReadyError if DefineAll() has not completed
 * @throws AlreadyDefinedError if the tree was already aggregated
 */
AggregatedSystem Aggregate(ModelBase &root);

} // namespace cadence
