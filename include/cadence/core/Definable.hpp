#pragma once

/**
 * @file Definable.hpp
 * @brief Common interface of models and connections
 *
 * Both node families expose the same staged hooks and take part in the same
 * traversal; the assembler only ever talks to this interface. A node owns
 * the frames, points and bodies it creates and records the loads, kinematic
 * differential equations and constraints it contributes.
 */

#include <cadence/core/CoreTypes.hpp>
#include <cadence/core/ModelOptions.hpp>
#include <cadence/symbolic/Point.hpp>
#include <cadence/symbolic/ReferenceFrame.hpp>
#include <cadence/symbolic/RigidBody.hpp>

#include <memory>
#include <string>
#include <vector>

namespace cadence {

class ModelBase;
class DefinitionContext;
class TreeAssembler;

/// Node family
enum class NodeKind : uint8_t { Model, Connection };

class Definable {
  public:
    virtual ~Definable() = default;

    Definable(const Definable &) = delete;
    Definable &operator=(const Definable &) = delete;

    // =========================================================================
    // Identity
    // =========================================================================

    [[nodiscard]] const std::string &Name() const { return name_; }

    /// Dot-joined chain of names from the root ("bicycle.front_wheel")
    [[nodiscard]] std::string Path() const;

    /// Registered type name ("KnifeEdgeWheel")
    [[nodiscard]] virtual std::string TypeName() const = 0;

    /**
     * @brief Type and abstract family names this node belongs to
     *
     * Used to match requirements, e.g. {"KnifeEdgeWheel", "WheelBase"}.
     */
    [[nodiscard]] virtual std::vector<std::string> Families() const { return {TypeName()}; }

    [[nodiscard]] NodeKind Kind() const { return kind_; }
    [[nodiscard]] DefinitionStage Stage() const { return stage_; }

    /// Registering parent (nullptr for a root or a detached node)
    [[nodiscard]] ModelBase *Parent() const { return parent_; }

    [[nodiscard]] const ModelOptions &Options() const { return options_; }
    void SetOptions(ModelOptions options) { options_ = std::move(options); }

    // =========================================================================
    // Contributed content
    // =========================================================================

    [[nodiscard]] const std::vector<std::unique_ptr<ReferenceFrame>> &Frames() const {
        return frames_;
    }
    [[nodiscard]] const std::vector<std::unique_ptr<Point>> &Points() const { return points_; }
    [[nodiscard]] const std::vector<std::unique_ptr<RigidBody>> &Bodies() const {
        return bodies_;
    }
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

  protected:
    Definable(std::string name, NodeKind kind);

    // =========================================================================
    // Stage hooks (all optional)
    // =========================================================================

    /// Structure only: declare connections between children
    virtual void DefineConnections(DefinitionContext & /*ctx*/) {}

    /// Create bodies, frames, points and symbols
    virtual void DefineObjects(DefinitionContext & /*ctx*/) {}

    /// Orientations, positions, velocities and kinematic differential equations
    virtual void DefineKinematics(DefinitionContext & /*ctx*/) {}

    /// Forces and torques
    virtual void DefineLoads(DefinitionContext & /*ctx*/) {}

    /// Holonomic and nonholonomic constraints
    virtual void DefineConstraints(DefinitionContext & /*ctx*/) {}

  private:
    friend class TreeAssembler;
    friend class DefinitionContext;
    friend class ModelBase;

    std::string name_;
    NodeKind kind_;
    ModelBase *parent_ = nullptr;
    DefinitionStage stage_ = DefinitionStage::Uninitialized;
    ModelOptions options_;

    std::vector<std::unique_ptr<ReferenceFrame>> frames_;
    std::vector<std::unique_ptr<Point>> points_;
    std::vector<std::unique_ptr<RigidBody>> bodies_;
    std::vector<Load> loads_;
    std::vector<Equation> kdes_;
    std::vector<Equation> holonomic_;
    std::vector<Equation> nonholonomic_;
    std::vector<SymbolicScalar> dependent_speeds_;
};

} // namespace cadence
