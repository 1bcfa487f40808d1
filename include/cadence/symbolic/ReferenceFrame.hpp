#pragma once

/**
 * @file ReferenceFrame.hpp
 * @brief Reference frames with lazily composed orientations
 *
 * Frames form a forest. Orienting a frame relative to another links the two
 * trees; the direction cosine matrix between any two frames of one tree is
 * composed through the common root on demand. Orienting a frame that already
 * has a parent re-roots its tree so the new relation can be recorded, which
 * lets a sub-model position its own bodies before a connection ties its
 * interface frame to a frame elsewhere in the model.
 */

#include <cadence/core/CoreTypes.hpp>
#include <cadence/symbolic/Vector.hpp>

#include <array>
#include <optional>
#include <string>

namespace cadence {

class TimeDerivative;

/// Principal axis selector
enum class Axis : uint8_t { X, Y, Z };

inline std::array<double, 3> AxisComponents(Axis axis) {
    switch (axis) {
    case Axis::X:
        return {1.0, 0.0, 0.0};
    case Axis::Y:
        return {0.0, 1.0, 0.0};
    case Axis::Z:
        return {0.0, 0.0, 1.0};
    }
    return {0.0, 0.0, 1.0};
}

class ReferenceFrame {
  public:
    explicit ReferenceFrame(std::string name) : name_(std::move(name)) {}

    ReferenceFrame(const ReferenceFrame &) = delete;
    ReferenceFrame &operator=(const ReferenceFrame &) = delete;

    [[nodiscard]] const std::string &Name() const { return name_; }

    /**
     * @brief Orient this frame by a rotation of @p angle about a parent axis
     * @throws StructuralError if the frames are already connected (closed loop)
     */
    void OrientAxis(ReferenceFrame &parent, const SymbolicScalar &angle, Axis axis);

    /// Rotation about an arbitrary constant unit axis (parent components)
    void OrientAxis(ReferenceFrame &parent, const SymbolicScalar &angle,
                    const std::array<double, 3> &axis);

    /**
     * @brief Orient this frame with an explicit direction cosine matrix
     * @param parent_R_this 3x3 matrix mapping this frame's components to the parent's
     */
    void OrientDcm(ReferenceFrame &parent, const SymbolicScalar &parent_R_this);

    /// Rigidly align this frame with @p parent
    void Fix(ReferenceFrame &parent);

    /**
     * @brief Direction cosine matrix this_R_other
     *
     * Maps components expressed in @p other to components in this frame.
     * @throws NotReadyError if the frames are not connected
     */
    [[nodiscard]] SymbolicScalar Dcm(const ReferenceFrame &other) const;

    /**
     * @brief Angular velocity of this frame as seen from @p frame
     * @throws NotReadyError if the frames are not connected
     */
    [[nodiscard]] Vector AngVel(const ReferenceFrame &frame,
                                const TimeDerivative &derivatives) const;

    [[nodiscard]] bool IsConnectedTo(const ReferenceFrame &other) const;

    [[nodiscard]] const ReferenceFrame &Root() const;
    [[nodiscard]] const ReferenceFrame *Parent() const;

    [[nodiscard]] Vector X() const;
    [[nodiscard]] Vector Y() const;
    [[nodiscard]] Vector Z() const;
    [[nodiscard]] Vector Unit(Axis axis) const;

  private:
    /// Orientation relative to the parent frame
    struct Edge {
        ReferenceFrame *parent = nullptr;
        SymbolicScalar parent_R_child;
        std::optional<std::array<double, 3>> axis; ///< Set for simple rotations
        SymbolicScalar angle;
    };

    void Attach(Edge edge);
    void MakeRoot();

    /// ancestor_R_this for a frame on this frame's parent chain
    [[nodiscard]] SymbolicScalar AncestorDcm(const ReferenceFrame &ancestor) const;

    /// Angular velocity relative to the tree root
    [[nodiscard]] Vector AngVelFromRoot(const TimeDerivative &derivatives) const;

    std::string name_;
    std::optional<Edge> edge_;
};

} // namespace cadence
