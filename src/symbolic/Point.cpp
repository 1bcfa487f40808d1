/**
 * @file Point.cpp
 * @brief Point forest and velocity derivation
 */

#include <cadence/symbolic/Point.hpp>

#include <cadence/core/Error.hpp>
#include <cadence/symbolic/ReferenceFrame.hpp>
#include <cadence/symbolic/Symbol.hpp>

#include <deque>
#include <unordered_set>

namespace cadence {

void Point::SetPos(Point &other, const Vector &position) {
    if (&other == this) {
        throw StructuralError("point '" + name_ + "' cannot be located relative to itself");
    }
    if (IsRelatedTo(other)) {
        throw StructuralError("locating point '" + name_ + "' relative to '" + other.Name() +
                              "' closes a kinematic loop");
    }
    MakeRoot();
    edge_ = Edge{&other, position};
    linked_.push_back(&other);
    other.linked_.push_back(this);
}

void Point::MakeRoot() {
    std::vector<Point *> chain;
    for (Point *p = this; p != nullptr; p = p->edge_ ? p->edge_->parent : nullptr) {
        chain.push_back(p);
    }
    for (std::size_t i = chain.size() - 1; i >= 1; --i) {
        Point *upper = chain[i];
        Point *lower = chain[i - 1];
        upper->edge_ = Edge{lower, -lower->edge_->offset};
    }
    edge_.reset();
}

bool Point::IsRelatedTo(const Point &other) const { return &Root() == &other.Root(); }

const Point &Point::Root() const {
    const Point *p = this;
    while (p->edge_) {
        p = p->edge_->parent;
    }
    return *p;
}

Vector Point::PosFromAncestor(const Point &ancestor) const {
    Vector pos;
    for (const Point *p = this; p != &ancestor; p = p->edge_->parent) {
        pos += p->edge_->offset;
    }
    return pos;
}

Vector Point::PosFrom(const Point &other) const {
    if (&other == this) {
        return Vector();
    }
    if (!IsRelatedTo(other)) {
        throw NotReadyError("position of '" + name_ + "' from '" + other.Name() +
                            "' is undefined (points not related)");
    }
    // Walk both chains only up to their closest common point
    std::unordered_set<const Point *> ancestors;
    for (const Point *p = &other; p != nullptr; p = p->edge_ ? p->edge_->parent : nullptr) {
        ancestors.insert(p);
    }
    const Point *common = this;
    while (ancestors.count(common) == 0) {
        common = common->edge_->parent;
    }
    return PosFromAncestor(*common) - other.PosFromAncestor(*common);
}

void Point::SetVel(const ReferenceFrame &frame, const Vector &velocity) {
    for (auto &entry : velocities_) {
        if (entry.first == &frame) {
            entry.second = velocity;
            return;
        }
    }
    velocities_.emplace_back(&frame, velocity);
}

Vector Point::Vel(const ReferenceFrame &frame, const TimeDerivative &derivatives) const {
    for (const auto &entry : velocities_) {
        if (entry.first == &frame) {
            return entry.second;
        }
    }
    // Breadth first over the whole tree so anchors below the root are found too
    std::unordered_set<const Point *> visited{this};
    std::deque<const Point *> queue{this};
    while (!queue.empty()) {
        const Point *p = queue.front();
        queue.pop_front();
        for (const auto &entry : p->velocities_) {
            if (entry.first == &frame) {
                return entry.second + PosFrom(*p).Dt(frame, derivatives);
            }
        }
        for (const Point *next : p->linked_) {
            if (visited.insert(next).second) {
                queue.push_back(next);
            }
        }
    }
    throw NotReadyError("velocity of point '" + name_ + "' in frame '" + frame.Name() +
                        "' is not defined");
}

} // namespace cadence
