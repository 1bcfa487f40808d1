#pragma once

/**
 * @file RigidBody.hpp
 * @brief Rigid bodies, applied loads and constraint equations
 */

#include <cadence/core/CoreTypes.hpp>
#include <cadence/symbolic/Algebra.hpp>
#include <cadence/symbolic/Point.hpp>
#include <cadence/symbolic/ReferenceFrame.hpp>

#include <string>

namespace cadence {

/**
 * @brief Rigid body with a body-fixed frame and mass center
 *
 * The frame and point are owned by the defining node; the body only refers
 * to them. Inertia is the 3x3 central inertia tensor in body-frame
 * components.
 */
struct RigidBody {
    std::string name;
    std::string owner_path;
    ReferenceFrame *frame = nullptr;
    Point *masscenter = nullptr;
    SymbolicScalar mass;
    SymbolicScalar inertia;

    /// Diagonal central inertia tensor
    [[nodiscard]] static SymbolicScalar Inertia(const SymbolicScalar &ixx, const SymbolicScalar &iyy,
                                                const SymbolicScalar &izz) {
        SymbolicScalar inertia = algebra::Zeros(3, 3);
        inertia(0, 0) = ixx;
        inertia(1, 1) = iyy;
        inertia(2, 2) = izz;
        return inertia;
    }
};

enum class LoadKind : uint8_t { Force, Torque };

/**
 * @brief Force acting at a point or torque acting on a frame
 */
struct Load {
    LoadKind kind = LoadKind::Force;
    const Point *point = nullptr;          ///< Force only
    const ReferenceFrame *frame = nullptr; ///< Torque only
    Vector vector;
    std::string owner_path;

    [[nodiscard]] static Load Force(const Point &point, const Vector &force) {
        Load load;
        load.kind = LoadKind::Force;
        load.point = &point;
        load.vector = force;
        return load;
    }

    [[nodiscard]] static Load Torque(const ReferenceFrame &frame, const Vector &torque) {
        Load load;
        load.kind = LoadKind::Torque;
        load.frame = &frame;
        load.vector = torque;
        return load;
    }
};

/// Scalar equation (expr == 0) tagged with the node that contributed it
struct Equation {
    SymbolicScalar expr;
    std::string owner_path;
};

} // namespace cadence
