#pragma once

/**
 * @file DefinitionContext.hpp
 * @brief Stage-scoped access handed to a node's definition hooks
 *
 * The context is the only way a hook creates symbols, objects and equations.
 * Every operation checks the current stage, so a hook that reaches for
 * something belonging to another stage fails immediately with a
 * DefinitionError naming the node.
 */

#include <cadence/core/CoreTypes.hpp>
#include <cadence/symbolic/Point.hpp>
#include <cadence/symbolic/ReferenceFrame.hpp>
#include <cadence/symbolic/RigidBody.hpp>
#include <cadence/symbolic/SymbolRegistry.hpp>

#include <string>

namespace cadence {

class Definable;
class ModelBase;
class Interface;

class DefinitionContext {
  public:
    DefinitionContext(Definable &node, ModelBase &root, SymbolRegistry &registry,
                      DefinitionStage stage);

    [[nodiscard]] DefinitionStage Stage() const { return stage_; }

    /// Path of the node being defined
    [[nodiscard]] const std::string &Path() const { return path_; }

    // =========================================================================
    // Symbols
    // =========================================================================

    /**
     * @brief Constant scoped to this node (mass, radius, gravity)
     *
     * New constants may be created from the objects stage on; later calls
     * with the same name return the same symbol.
     */
    SymbolicScalar Constant(const std::string &name, const std::string &description = "");

    /// Generalized coordinate; new ones only during the objects stage
    const Symbol &Coordinate(const std::string &name, const std::string &description);

    /// Generalized speed; new ones only during the objects stage
    const Symbol &Speed(const std::string &name, const std::string &description);

    /// Specified quantity such as an actuator torque
    SymbolicScalar Auxiliary(const std::string &name, const std::string &description = "");

    /// Time differentiation over all registered coordinates and speeds
    [[nodiscard]] const TimeDerivative &Derivatives() const { return registry_.Derivatives(); }

    [[nodiscard]] SymbolRegistry &Registry() { return registry_; }

    // =========================================================================
    // Objects (objects stage)
    // =========================================================================

    /// New frame named "<path>.<name>", owned by this node
    ReferenceFrame &NewFrame(const std::string &name);

    /// New point named "<path>.<name>", owned by this node
    Point &NewPoint(const std::string &name);

    /// New rigid body with its own frame and mass center
    RigidBody &NewRigidBody(const std::string &name, const SymbolicScalar &mass,
                            const SymbolicScalar &inertia);

    /// Bind one of this node's declared interfaces
    void BindInterface(Interface &interface, Point &point, ReferenceFrame &frame);

    /**
     * @brief Bind one of this node's interfaces to the point and frame of
     * @p inner, an interface of a model below this node
     *
     * Lets a composite model expose a sub-model's attachment point as its own.
     */
    void ForwardInterface(Interface &interface, const Interface &inner);

    /**
     * @brief Writable point of an interface this node owns
     * @throws DefinitionError if @p interface belongs to another node
     */
    Point &InterfacePoint(Interface &interface);

    /// Writable frame of an interface this node owns
    ReferenceFrame &InterfaceFrame(Interface &interface);

    /**
     * @brief Declare the inertial frame and its fixed origin for the whole tree
     * @throws StructuralError if another node already declared one
     */
    void SetInertialFrame(ReferenceFrame &frame, Point &origin);

    [[nodiscard]] bool HasInertialFrame() const;

    /// @throws NotReadyError if no node declared an inertial frame yet
    [[nodiscard]] ReferenceFrame &InertialFrame() const;

    /// @throws NotReadyError if no node declared an inertial frame yet
    [[nodiscard]] Point &InertialOrigin() const;

    // =========================================================================
    // Equations
    // =========================================================================

    /// Kinematic differential equation expr == 0 (kinematics stage)
    void AddKinematicEquation(const SymbolicScalar &expr);

    /// Force or torque (loads stage)
    void AddLoad(Load load);

    /// Configuration constraint f(q) == 0 (constraints stage)
    void AddHolonomicConstraint(const SymbolicScalar &expr);

    /// Velocity constraint g(q, u) == 0 (constraints stage)
    void AddNonholonomicConstraint(const SymbolicScalar &expr);

    /// Mark a generalized speed as dependent (constraints stage)
    void MarkDependentSpeed(const SymbolicScalar &speed);

  private:
    void RequireStage(DefinitionStage stage, const char *operation) const;
    void RequireOwner(const Interface &interface, const char *operation) const;
    const Symbol &Generate(const std::string &name, SymbolKind kind,
                           const std::string &description, DefinitionStage creation_stage);

    Definable &node_;
    ModelBase &root_;
    SymbolRegistry &registry_;
    DefinitionStage stage_;
    std::string path_;
};

} // namespace cadence
