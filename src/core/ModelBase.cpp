/**
 * @file ModelBase.cpp
 * @brief Tree construction and the DefineAll() entry point
 */

#include <cadence/core/ModelBase.hpp>

#include <cadence/assembly/TreeAssembler.hpp>
#include <cadence/core/ConnectionBase.hpp>
#include <cadence/core/DefinitionContext.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/io/LogService.hpp>
#include <cadence/symbolic/SymbolRegistry.hpp>

#include <functional>

namespace cadence {

ModelBase::ModelBase(std::string name) : Definable(std::move(name), NodeKind::Model) {}

ModelBase::~ModelBase() = default;

// =============================================================================
// Tree construction
// =============================================================================

ModelBase &ModelBase::RootModel() {
    ModelBase *model = this;
    while (model->Parent() != nullptr) {
        model = model->Parent();
    }
    return *model;
}

bool ModelBase::IsAncestorOrSelf(const ModelBase &other) const {
    for (const ModelBase *m = &other; m != nullptr; m = m->Parent()) {
        if (m == this) {
            return true;
        }
    }
    return false;
}

bool ModelBase::HasSiblingName(const std::string &name) const {
    for (const auto &child : children_) {
        if (child.model->Name() == name) {
            return true;
        }
    }
    for (const auto &slot : connections_) {
        if (slot.connection->Name() == name) {
            return true;
        }
    }
    return false;
}

const Requirement *ModelBase::FindRequirement(const std::string &role,
                                              RequirementKind kind) const {
    for (const auto &requirement : requirements_) {
        if (requirement.AttributeName() == role && requirement.Kind() == kind) {
            return &requirement;
        }
    }
    return nullptr;
}

const char *ModelBase::ConstructionStageName() {
    const ModelBase &root = RootModel();
    return StageName(root.running_stage_ ? *root.running_stage_ : Stage());
}

void ModelBase::AttachSubModelImpl(const std::string &role, std::unique_ptr<ModelBase> child) {
    try {
        if (!child) {
            throw StructuralError("cannot attach a null sub-model to '" + Path() + "'");
        }
        if (!IsIdentifier(role)) {
            throw DefinitionError("'" + role + "' is not a valid role name");
        }
        if (RootModel().define_attempted_) {
            throw AlreadyDefinedError("cannot attach '" + child->Name() + "' to '" + Path() +
                                      "' after DefineAll()");
        }
        if (child->Parent() != nullptr) {
            // Owned by another parent: never destroy it here
            ModelBase *other = child.release();
            throw StructuralError("'" + other->Path() + "' already has a parent");
        }
        if (child->IsAncestorOrSelf(*this)) {
            ModelBase *ancestor = child.release();
            throw StructuralError::Cycle(Path(), ancestor->Name());
        }
        if (HasSubModel(role)) {
            throw StructuralError("'" + Path() + "' already has a sub-model in role '" + role +
                                  "'");
        }
        if (HasSiblingName(child->Name())) {
            throw StructuralError::DuplicateName(Path(), child->Name());
        }
        if (const Requirement *requirement = FindRequirement(role, RequirementKind::Model)) {
            if (!requirement->IsSatisfiedBy(child->Families())) {
                throw StructuralError("'" + child->TypeName() + "' cannot fill role '" + role +
                                      "' of '" + Path() + "' (expected " +
                                      requirement->TypeName() + ")");
            }
        }

        child->parent_ = this;
        CADENCE_LOG_TRACE("Attached '" + child->Name() + "' to '" + Path() + "' as '" + role +
                          "'");
        children_.push_back(Child{role, std::move(child)});
    } catch (Error &e) {
        e.AnnotateNode(Path(), ConstructionStageName());
        throw;
    }
}

void ModelBase::AddConnectionImpl(const std::string &role,
                                  std::unique_ptr<ConnectionBase> connection) {
    try {
        if (!connection) {
            throw StructuralError("cannot register a null connection with '" + Path() + "'");
        }
        const std::string slot = role.empty() ? connection->Name() : role;
        if (!IsIdentifier(slot)) {
            throw DefinitionError("'" + slot + "' is not a valid role name");
        }

        ModelBase &root = RootModel();
        if (root.define_attempted_ && root.running_stage_ != DefinitionStage::ConnectionsDefined) {
            throw AlreadyDefinedError(
                "connection '" + connection->Name() +
                "' can only be added before or during the connections stage");
        }
        if (connection->Parent() != nullptr) {
            ConnectionBase *other = connection.release();
            throw StructuralError("connection '" + other->Path() + "' is already registered");
        }

        const auto &interfaces = connection->Interfaces();
        if (interfaces.size() < 2) {
            throw StructuralError("connection '" + connection->Name() +
                                  "' must join at least two interfaces");
        }
        for (std::size_t i = 0; i < interfaces.size(); ++i) {
            if (interfaces[i] == nullptr) {
                throw StructuralError("connection '" + connection->Name() +
                                      "' has a null interface");
            }
            for (std::size_t j = 0; j < i; ++j) {
                if (&interfaces[i]->Owner() == &interfaces[j]->Owner()) {
                    throw StructuralError::SelfConnection(connection->Name(),
                                                          interfaces[i]->Owner().Path());
                }
            }
            if (!IsAncestorOrSelf(interfaces[i]->Owner())) {
                throw StructuralError("interface '" + interfaces[i]->Path() +
                                      "' is not part of the tree below '" + Path() + "'");
            }
        }
        for (const Interface *interface : interfaces) {
            if (interface->IsClaimed()) {
                throw InterfaceConflictError(interface->Path(), interface->Connection().Path(),
                                             MakeFullPath(Path(), connection->Name()));
            }
        }

        if (HasConnection(slot) || HasSiblingName(connection->Name())) {
            throw StructuralError::DuplicateName(Path(), connection->Name());
        }
        if (const Requirement *requirement = FindRequirement(slot, RequirementKind::Connection)) {
            if (!requirement->IsSatisfiedBy(connection->Families())) {
                throw StructuralError("'" + connection->TypeName() + "' cannot fill role '" +
                                      slot + "' of '" + Path() + "' (expected " +
                                      requirement->TypeName() + ")");
            }
        }

        for (Interface *interface : interfaces) {
            interface->Claim(*connection);
        }
        connection->parent_ = this;
        CADENCE_LOG_TRACE("Registered connection '" + connection->Name() + "' with '" + Path() +
                          "'");
        connections_.push_back(ConnectionSlot{slot, std::move(connection)});
    } catch (Error &e) {
        e.AnnotateNode(Path(), ConstructionStageName());
        throw;
    }
}

bool ModelBase::HasSubModel(const std::string &role) const {
    for (const auto &child : children_) {
        if (child.role == role) {
            return true;
        }
    }
    return false;
}

ModelBase &ModelBase::GetSubModel(const std::string &role) const {
    for (const auto &child : children_) {
        if (child.role == role) {
            return *child.model;
        }
    }
    throw StructuralError("'" + Path() + "' has no sub-model in role '" + role + "'");
}

bool ModelBase::HasConnection(const std::string &role) const {
    for (const auto &slot : connections_) {
        if (slot.role == role) {
            return true;
        }
    }
    return false;
}

ConnectionBase &ModelBase::GetConnection(const std::string &role) const {
    for (const auto &slot : connections_) {
        if (slot.role == role) {
            return *slot.connection;
        }
    }
    throw StructuralError("'" + Path() + "' has no connection in role '" + role + "'");
}

bool ModelBase::HasInterface(const std::string &role) const {
    for (const auto &interface : interfaces_) {
        if (interface->Role() == role) {
            return true;
        }
    }
    return false;
}

Interface &ModelBase::GetInterface(const std::string &role) const {
    for (const auto &interface : interfaces_) {
        if (interface->Role() == role) {
            return *interface;
        }
    }
    throw StructuralError("'" + Path() + "' declares no interface '" + role + "'");
}

Interface &ModelBase::DeclareInterface(const std::string &role) {
    if (!IsIdentifier(role)) {
        throw DefinitionError("'" + role + "' is not a valid interface name");
    }
    if (HasInterface(role)) {
        throw StructuralError("'" + Path() + "' already declares interface '" + role + "'");
    }
    if (Stage() > DefinitionStage::Uninitialized) {
        throw AlreadyDefinedError("interface '" + role + "' of '" + Path() +
                                  "' declared after the connections stage");
    }
    interfaces_.push_back(std::make_unique<Interface>(*this, role));
    return *interfaces_.back();
}

void ModelBase::DeclareRequirement(Requirement requirement) {
    if (FindRequirement(requirement.AttributeName(), requirement.Kind()) != nullptr) {
        throw StructuralError("'" + Path() + "' already declares requirement '" +
                              requirement.AttributeName() + "'");
    }
    requirements_.push_back(std::move(requirement));
}

void ModelBase::ApplyUniformGravity(DefinitionContext &ctx, const SymbolicScalar &gravity,
                                    Axis axis) const {
    ApplyUniformGravity(ctx, gravity, ctx.InertialFrame().Unit(axis));
}

void ModelBase::ApplyUniformGravity(DefinitionContext &ctx, const SymbolicScalar &gravity,
                                    const Vector &direction) const {
    auto apply = [&](const Definable &node) {
        for (const auto &body : node.Bodies()) {
            ctx.AddLoad(Load::Force(*body->masscenter, direction * (body->mass * gravity)));
        }
    };
    std::function<void(const ModelBase &)> visit = [&](const ModelBase &model) {
        apply(model);
        for (const auto &child : model.Children()) {
            visit(*child.model);
        }
        for (const auto &slot : model.Connections()) {
            apply(*slot.connection);
        }
    };
    visit(*this);
}

// =============================================================================
// Lifecycle
// =============================================================================

void ModelBase::DefineAll() {
    if (Parent() != nullptr) {
        throw StructuralError("DefineAll() may only be called on the root model, '" + Path() +
                              "' has a parent");
    }
    if (define_attempted_) {
        throw AlreadyDefinedError("DefineAll() was already invoked on '" + Name() + "'");
    }
    define_attempted_ = true;

    registry_ = std::make_unique<SymbolRegistry>();
    TreeAssembler assembler(*this, *registry_);
    assembler.Run();
}

} // namespace cadence
