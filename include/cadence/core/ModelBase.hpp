#pragma once

/**
 * @file ModelBase.hpp
 * @brief Abstract unit of composition
 *
 * A model owns its child models (keyed by role), the connections it
 * registers between them, and the interfaces it exposes to its own parent.
 * The root model drives the whole tree through DefineAll().
 */

#include <cadence/core/Definable.hpp>
#include <cadence/core/Interface.hpp>
#include <cadence/core/Requirement.hpp>

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace cadence {

class ConnectionBase;
class SymbolRegistry;
class AggregatedSystem;

/**
 * @brief Base class for all sub-models
 *
 * Example:
 * @code
 * auto root = std::make_unique<RollingDisc>("rolling_disc");
 * root->AttachSubModel("disc", std::make_unique<KnifeEdgeWheel>("disc"));
 * root->AttachSubModel("ground", std::make_unique<FlatGround>("ground"));
 * root->AddConnection(std::make_unique<NonHolonomicTyre>(
 *     "tyre", root->GetSubModel("ground").GetInterface("surface"),
 *     root->GetSubModel("disc").GetInterface("hub")));
 * root->DefineAll();
 * @endcode
 */
class ModelBase : public Definable {
  public:
    /// Child model registered under a role
    struct Child {
        std::string role;
        std::unique_ptr<ModelBase> model;
    };

    /// Connection registered under a role (defaults to its name)
    struct ConnectionSlot {
        std::string role;
        std::unique_ptr<ConnectionBase> connection;
    };

    explicit ModelBase(std::string name);
    ~ModelBase() override;

    // =========================================================================
    // Tree construction
    // =========================================================================

    /**
     * @brief Attach a child model under @p role
     *
     * @throws StructuralError for a duplicate role or name, a cycle, a child
     *         that already has a parent, or a child not matching the role's
     *         requirement
     * @throws AlreadyDefinedError once the tree's DefineAll() was invoked
     */
    template <typename T> T &AttachSubModel(const std::string &role, std::unique_ptr<T> child) {
        static_assert(std::is_base_of_v<ModelBase, T>, "T must derive from ModelBase");
        T *raw = child.get();
        AttachSubModelImpl(role, std::unique_ptr<ModelBase>(std::move(child)));
        return *raw;
    }

    /**
     * @brief Register a connection joining interfaces of this model's subtree
     *
     * Allowed before DefineAll() and while the connections stage runs.
     *
     * @throws StructuralError for a self-connection, interfaces outside this
     *         subtree or a duplicate name
     * @throws InterfaceConflictError if an interface is already claimed
     */
    template <typename T> T &AddConnection(std::unique_ptr<T> connection) {
        static_assert(std::is_base_of_v<ConnectionBase, T>, "T must derive from ConnectionBase");
        T *raw = connection.get();
        AddConnectionImpl("", std::unique_ptr<ConnectionBase>(std::move(connection)));
        return *raw;
    }

    /// Register a connection under an explicit role
    template <typename T>
    T &AddConnection(const std::string &role, std::unique_ptr<T> connection) {
        static_assert(std::is_base_of_v<ConnectionBase, T>, "T must derive from ConnectionBase");
        T *raw = connection.get();
        AddConnectionImpl(role, std::unique_ptr<ConnectionBase>(std::move(connection)));
        return *raw;
    }

    [[nodiscard]] bool HasSubModel(const std::string &role) const;

    /// @throws StructuralError if no child holds @p role
    [[nodiscard]] ModelBase &GetSubModel(const std::string &role) const;

    /// Typed child lookup
    template <typename T> [[nodiscard]] T &GetSubModel(const std::string &role) const {
        auto *typed = dynamic_cast<T *>(&GetSubModel(role));
        if (typed == nullptr) {
            throw StructuralError("sub-model '" + role + "' of '" + Path() +
                                  "' has unexpected type");
        }
        return *typed;
    }

    [[nodiscard]] bool HasConnection(const std::string &role) const;

    /// @throws StructuralError if no connection holds @p role
    [[nodiscard]] ConnectionBase &GetConnection(const std::string &role) const;

    [[nodiscard]] bool HasInterface(const std::string &role) const;

    /// @throws StructuralError if this model declares no such interface
    [[nodiscard]] Interface &GetInterface(const std::string &role) const;

    [[nodiscard]] const std::vector<Child> &Children() const { return children_; }
    [[nodiscard]] const std::vector<ConnectionSlot> &Connections() const { return connections_; }
    [[nodiscard]] const std::vector<std::unique_ptr<Interface>> &Interfaces() const {
        return interfaces_;
    }
    [[nodiscard]] const std::vector<Requirement> &Requirements() const { return requirements_; }

    // =========================================================================
    // Lifecycle (root only)
    // =========================================================================

    /**
     * @brief Run every definition stage over the whole tree
     *
     * Single shot: a second call raises AlreadyDefinedError, also after a
     * failed first attempt (the tree is then unusable and should be
     * discarded).
     *
     * @throws StructuralError if called on a non-root model
     */
    void DefineAll();

    [[nodiscard]] bool DefineAttempted() const { return define_attempted_; }

    /// Symbol registry of the last DefineAll() (nullptr after aggregation)
    [[nodiscard]] const SymbolRegistry *Registry() const { return registry_.get(); }

    /// Inertial frame declared during definition (root only, nullptr if none)
    [[nodiscard]] ReferenceFrame *InertialFrame() const { return inertial_frame_; }
    [[nodiscard]] Point *InertialOrigin() const { return inertial_origin_; }

  protected:
    /// Declare an interface exposed to the parent (constructor or connections stage)
    Interface &DeclareInterface(const std::string &role);

    /// Declare a role requirement for a child model or connection
    void DeclareRequirement(Requirement requirement);

    /**
     * @brief Apply gravity m*g along an inertial axis to every body in this subtree
     *
     * Call from DefineLoads(); the loads are recorded on this model.
     */
    void ApplyUniformGravity(DefinitionContext &ctx, const SymbolicScalar &gravity,
                             Axis axis = Axis::Z) const;

    /// Gravity m*g along an arbitrary unit @p direction
    void ApplyUniformGravity(DefinitionContext &ctx, const SymbolicScalar &gravity,
                             const Vector &direction) const;

  private:
    friend class TreeAssembler;
    friend class DefinitionContext;
    friend AggregatedSystem Aggregate(ModelBase &root);

    void AttachSubModelImpl(const std::string &role, std::unique_ptr<ModelBase> child);
    void AddConnectionImpl(const std::string &role, std::unique_ptr<ConnectionBase> connection);

    [[nodiscard]] ModelBase &RootModel();
    /// Stage name attached to errors raised while building the tree
    [[nodiscard]] const char *ConstructionStageName();
    [[nodiscard]] bool IsAncestorOrSelf(const ModelBase &other) const;
    [[nodiscard]] bool HasSiblingName(const std::string &name) const;
    [[nodiscard]] const Requirement *FindRequirement(const std::string &role,
                                                     RequirementKind kind) const;

    std::vector<Child> children_;
    std::vector<ConnectionSlot> connections_;
    std::vector<std::unique_ptr<Interface>> interfaces_;
    std::vector<Requirement> requirements_;

    // Root-only lifecycle state
    bool define_attempted_ = false;
    bool aggregated_ = false;
    std::optional<DefinitionStage> running_stage_;
    std::unique_ptr<SymbolRegistry> registry_;
    ReferenceFrame *inertial_frame_ = nullptr;
    Point *inertial_origin_ = nullptr;
};

} // namespace cadence
