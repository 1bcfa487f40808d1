/**
 * @file Definable.cpp
 * @brief Node identity, interfaces and the stage-scoped definition context
 */

#include <cadence/core/Definable.hpp>

#include <cadence/core/ConnectionBase.hpp>
#include <cadence/core/DefinitionContext.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/core/Interface.hpp>
#include <cadence/core/ModelBase.hpp>

namespace cadence {

// =============================================================================
// Definable
// =============================================================================

Definable::Definable(std::string name, NodeKind kind) : name_(std::move(name)), kind_(kind) {
    if (!IsIdentifier(name_)) {
        throw DefinitionError("'" + name_ + "' is not a valid node name");
    }
    options_.name = name_;
}

std::string Definable::Path() const {
    if (parent_ == nullptr) {
        return name_;
    }
    return MakeFullPath(parent_->Path(), name_);
}

// =============================================================================
// Interface
// =============================================================================

std::string Interface::Path() const { return MakeFullPath(owner_->Path(), role_); }

void Interface::RequireReady(const char *what) const {
    if (owner_->Stage() < DefinitionStage::ObjectsDefined) {
        throw NotReadyError(std::string(what) + " of interface '" + Path() +
                            "' is not available before its owner completed the objects stage");
    }
    if (!IsBound()) {
        throw NotReadyError("interface '" + Path() + "' was never bound by its owner");
    }
}

const Point &Interface::GetPoint() const { return MutablePoint(); }

const ReferenceFrame &Interface::GetFrame() const { return MutableFrame(); }

Point &Interface::MutablePoint() const {
    RequireReady("point");
    return *point_;
}

ReferenceFrame &Interface::MutableFrame() const {
    RequireReady("frame");
    return *frame_;
}

ConnectionBase &Interface::Connection() const {
    if (connection_ == nullptr) {
        throw NotReadyError("interface '" + Path() + "' is not claimed by any connection");
    }
    return *connection_;
}

// =============================================================================
// DefinitionContext
// =============================================================================

DefinitionContext::DefinitionContext(Definable &node, ModelBase &root, SymbolRegistry &registry,
                                     DefinitionStage stage)
    : node_(node), root_(root), registry_(registry), stage_(stage), path_(node.Path()) {}

void DefinitionContext::RequireStage(DefinitionStage stage, const char *operation) const {
    if (stage_ != stage) {
        throw DefinitionError(std::string(operation) + " is only available during the '" +
                              StageName(stage) + "' stage (current stage: '" +
                              StageName(stage_) + "')");
    }
}

const Symbol &DefinitionContext::Generate(const std::string &name, SymbolKind kind,
                                          const std::string &description,
                                          DefinitionStage creation_stage) {
    if (registry_.Has(path_, name, kind)) {
        return registry_.Generate(path_, name, kind, description);
    }
    bool allowed = kind == SymbolKind::Coordinate || kind == SymbolKind::Speed
                       ? stage_ == creation_stage
                       : stage_ >= creation_stage;
    if (!allowed) {
        throw DefinitionError(std::string("new ") + SymbolKindName(kind) + " '" + name +
                              "' cannot be created during the '" + StageName(stage_) +
                              "' stage");
    }
    return registry_.Generate(path_, name, kind, description);
}

SymbolicScalar DefinitionContext::Constant(const std::string &name,
                                           const std::string &description) {
    return Generate(name, SymbolKind::Constant, description, DefinitionStage::ObjectsDefined)
        .value;
}

const Symbol &DefinitionContext::Coordinate(const std::string &name,
                                            const std::string &description) {
    return Generate(name, SymbolKind::Coordinate, description, DefinitionStage::ObjectsDefined);
}

const Symbol &DefinitionContext::Speed(const std::string &name, const std::string &description) {
    return Generate(name, SymbolKind::Speed, description, DefinitionStage::ObjectsDefined);
}

SymbolicScalar DefinitionContext::Auxiliary(const std::string &name,
                                            const std::string &description) {
    return Generate(name, SymbolKind::Auxiliary, description, DefinitionStage::ObjectsDefined)
        .value;
}

ReferenceFrame &DefinitionContext::NewFrame(const std::string &name) {
    RequireStage(DefinitionStage::ObjectsDefined, "NewFrame");
    node_.frames_.push_back(std::make_unique<ReferenceFrame>(MakeFullPath(path_, name)));
    return *node_.frames_.back();
}

Point &DefinitionContext::NewPoint(const std::string &name) {
    RequireStage(DefinitionStage::ObjectsDefined, "NewPoint");
    node_.points_.push_back(std::make_unique<Point>(MakeFullPath(path_, name)));
    return *node_.points_.back();
}

RigidBody &DefinitionContext::NewRigidBody(const std::string &name, const SymbolicScalar &mass,
                                           const SymbolicScalar &inertia) {
    RequireStage(DefinitionStage::ObjectsDefined, "NewRigidBody");
    if (inertia.size1() != 3 || inertia.size2() != 3) {
        throw DefinitionError("inertia of body '" + name + "' must be 3x3");
    }
    auto body = std::make_unique<RigidBody>();
    body->name = MakeFullPath(path_, name);
    body->owner_path = path_;
    body->frame = &NewFrame(name + "_frame");
    body->masscenter = &NewPoint(name + "_masscenter");
    body->mass = mass;
    body->inertia = inertia;
    node_.bodies_.push_back(std::move(body));
    return *node_.bodies_.back();
}

void DefinitionContext::BindInterface(Interface &interface, Point &point, ReferenceFrame &frame) {
    RequireStage(DefinitionStage::ObjectsDefined, "BindInterface");
    if (&interface.Owner() != &node_) {
        throw DefinitionError("interface '" + interface.Path() +
                              "' can only be bound by its owner");
    }
    interface.Bind(point, frame);
}

void DefinitionContext::ForwardInterface(Interface &interface, const Interface &inner) {
    RequireStage(DefinitionStage::ObjectsDefined, "ForwardInterface");
    if (&interface.Owner() != &node_) {
        throw DefinitionError("interface '" + interface.Path() +
                              "' can only be bound by its owner");
    }
    if (&inner.Owner() == &node_ || !interface.Owner().IsAncestorOrSelf(inner.Owner())) {
        throw DefinitionError("interface '" + interface.Path() + "' cannot forward '" +
                              inner.Path() + "', which is not part of a sub-model");
    }
    interface.Bind(inner.MutablePoint(), inner.MutableFrame());
}

void DefinitionContext::RequireOwner(const Interface &interface, const char *operation) const {
    if (&interface.Owner() != &node_) {
        throw DefinitionError(std::string(operation) + ": interface '" + interface.Path() +
                              "' can only be modified by its owner or the connection claiming it");
    }
}

Point &DefinitionContext::InterfacePoint(Interface &interface) {
    RequireOwner(interface, "InterfacePoint");
    return interface.MutablePoint();
}

ReferenceFrame &DefinitionContext::InterfaceFrame(Interface &interface) {
    RequireOwner(interface, "InterfaceFrame");
    return interface.MutableFrame();
}

void DefinitionContext::SetInertialFrame(ReferenceFrame &frame, Point &origin) {
    RequireStage(DefinitionStage::ObjectsDefined, "SetInertialFrame");
    if (root_.inertial_frame_ != nullptr) {
        throw StructuralError("inertial frame already declared as '" +
                              root_.inertial_frame_->Name() + "'");
    }
    root_.inertial_frame_ = &frame;
    root_.inertial_origin_ = &origin;
    origin.SetVel(frame, Vector());
}

bool DefinitionContext::HasInertialFrame() const { return root_.inertial_frame_ != nullptr; }

ReferenceFrame &DefinitionContext::InertialFrame() const {
    if (root_.inertial_frame_ == nullptr) {
        throw NotReadyError("no inertial frame has been declared in '" + root_.Name() + "'");
    }
    return *root_.inertial_frame_;
}

Point &DefinitionContext::InertialOrigin() const {
    if (root_.inertial_origin_ == nullptr) {
        throw NotReadyError("no inertial origin has been declared in '" + root_.Name() + "'");
    }
    return *root_.inertial_origin_;
}

void DefinitionContext::AddKinematicEquation(const SymbolicScalar &expr) {
    RequireStage(DefinitionStage::KinematicsDefined, "AddKinematicEquation");
    node_.kdes_.push_back(Equation{expr, path_});
}

void DefinitionContext::AddLoad(Load load) {
    RequireStage(DefinitionStage::LoadsDefined, "AddLoad");
    load.owner_path = path_;
    node_.loads_.push_back(std::move(load));
}

void DefinitionContext::AddHolonomicConstraint(const SymbolicScalar &expr) {
    RequireStage(DefinitionStage::ConstraintsDefined, "AddHolonomicConstraint");
    node_.holonomic_.push_back(Equation{expr, path_});
}

void DefinitionContext::AddNonholonomicConstraint(const SymbolicScalar &expr) {
    RequireStage(DefinitionStage::ConstraintsDefined, "AddNonholonomicConstraint");
    node_.nonholonomic_.push_back(Equation{expr, path_});
}

void DefinitionContext::MarkDependentSpeed(const SymbolicScalar &speed) {
    RequireStage(DefinitionStage::ConstraintsDefined, "MarkDependentSpeed");
    if (!speed.is_symbolic()) {
        throw DefinitionError("dependent speed must be a speed symbol");
    }
    node_.dependent_speeds_.push_back(speed);
}

} // namespace cadence
