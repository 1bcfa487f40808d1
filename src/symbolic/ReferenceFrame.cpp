/**
 * @file ReferenceFrame.cpp
 * @brief Frame forest, DCM composition and angular velocities
 */

#include <cadence/symbolic/ReferenceFrame.hpp>

#include <cadence/core/Error.hpp>
#include <cadence/symbolic/Algebra.hpp>
#include <cadence/symbolic/Symbol.hpp>

#include <unordered_set>
#include <vector>

namespace cadence {

void ReferenceFrame::OrientAxis(ReferenceFrame &parent, const SymbolicScalar &angle, Axis axis) {
    OrientAxis(parent, angle, AxisComponents(axis));
}

void ReferenceFrame::OrientAxis(ReferenceFrame &parent, const SymbolicScalar &angle,
                                const std::array<double, 3> &axis) {
    Edge edge;
    edge.parent = &parent;
    edge.parent_R_child = algebra::AxisRotation(axis, angle);
    edge.axis = axis;
    edge.angle = angle;
    Attach(std::move(edge));
}

void ReferenceFrame::OrientDcm(ReferenceFrame &parent, const SymbolicScalar &parent_R_this) {
    if (parent_R_this.size1() != 3 || parent_R_this.size2() != 3) {
        throw DefinitionError("orientation of '" + name_ + "' needs a 3x3 matrix");
    }
    Edge edge;
    edge.parent = &parent;
    edge.parent_R_child = parent_R_this;
    Attach(std::move(edge));
}

void ReferenceFrame::Fix(ReferenceFrame &parent) { OrientDcm(parent, algebra::Identity(3)); }

void ReferenceFrame::Attach(Edge edge) {
    if (IsConnectedTo(*edge.parent)) {
        throw StructuralError("orienting frame '" + name_ + "' relative to '" +
                              edge.parent->Name() + "' closes a kinematic loop");
    }
    MakeRoot();
    edge_ = std::move(edge);
}

void ReferenceFrame::MakeRoot() {
    std::vector<ReferenceFrame *> chain;
    for (ReferenceFrame *f = this; f != nullptr; f = f->edge_ ? f->edge_->parent : nullptr) {
        chain.push_back(f);
    }
    // Invert edges from the old root down; each edge is read before it is overwritten
    for (std::size_t i = chain.size() - 1; i >= 1; --i) {
        ReferenceFrame *upper = chain[i];
        ReferenceFrame *lower = chain[i - 1];
        const Edge &down = *lower->edge_;
        Edge up;
        up.parent = lower;
        up.parent_R_child = algebra::Transpose(down.parent_R_child);
        up.axis = down.axis;
        if (down.axis) {
            up.angle = -down.angle;
        }
        upper->edge_ = std::move(up);
    }
    edge_.reset();
}

bool ReferenceFrame::IsConnectedTo(const ReferenceFrame &other) const {
    return &Root() == &other.Root();
}

const ReferenceFrame &ReferenceFrame::Root() const {
    const ReferenceFrame *f = this;
    while (f->edge_) {
        f = f->edge_->parent;
    }
    return *f;
}

const ReferenceFrame *ReferenceFrame::Parent() const {
    return edge_ ? edge_->parent : nullptr;
}

SymbolicScalar ReferenceFrame::AncestorDcm(const ReferenceFrame &ancestor) const {
    SymbolicScalar r = algebra::Identity(3);
    for (const ReferenceFrame *f = this; f != &ancestor; f = f->edge_->parent) {
        r = algebra::Mul(f->edge_->parent_R_child, r);
    }
    return r;
}

SymbolicScalar ReferenceFrame::Dcm(const ReferenceFrame &other) const {
    if (&other == this) {
        return algebra::Identity(3);
    }
    if (!IsConnectedTo(other)) {
        throw NotReadyError("frames '" + name_ + "' and '" + other.Name() +
                            "' have no relative orientation");
    }
    std::unordered_set<const ReferenceFrame *> ancestors;
    for (const ReferenceFrame *f = &other; f != nullptr; f = f->Parent()) {
        ancestors.insert(f);
    }
    const ReferenceFrame *common = this;
    while (ancestors.count(common) == 0) {
        common = common->edge_->parent;
    }
    return algebra::Mul(algebra::Transpose(AncestorDcm(*common)), other.AncestorDcm(*common));
}

Vector ReferenceFrame::AngVelFromRoot(const TimeDerivative &derivatives) const {
    Vector omega;
    for (const ReferenceFrame *f = this; f->edge_; f = f->edge_->parent) {
        const Edge &edge = *f->edge_;
        if (edge.axis) {
            omega += Vector(*edge.parent, derivatives.Dt(edge.angle) * algebra::Column3(*edge.axis));
        } else {
            // omega (child components) = vee(R^T dR/dt)
            SymbolicScalar r_dot = derivatives.Dt(edge.parent_R_child);
            omega += Vector(*f, algebra::Vee(algebra::Mul(algebra::Transpose(edge.parent_R_child),
                                                          r_dot)));
        }
    }
    return omega;
}

Vector ReferenceFrame::AngVel(const ReferenceFrame &frame,
                              const TimeDerivative &derivatives) const {
    if (!IsConnectedTo(frame)) {
        throw NotReadyError("angular velocity of '" + name_ + "' in '" + frame.Name() +
                            "' is undefined (frames not connected)");
    }
    return AngVelFromRoot(derivatives) - frame.AngVelFromRoot(derivatives);
}

Vector ReferenceFrame::X() const { return Unit(Axis::X); }
Vector ReferenceFrame::Y() const { return Unit(Axis::Y); }
Vector ReferenceFrame::Z() const { return Unit(Axis::Z); }

Vector ReferenceFrame::Unit(Axis axis) const {
    return Vector(*this, algebra::Column3(AxisComponents(axis)));
}

} // namespace cadence
