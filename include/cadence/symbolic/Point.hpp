#pragma once

/**
 * @file Point.hpp
 * @brief Points with lazily composed positions and velocities
 *
 * Like frames, points form a forest linked by relative position vectors.
 * Velocities are either set explicitly or derived from a located parent
 * point by differentiating the connecting position vector.
 */

#include <cadence/core/CoreTypes.hpp>
#include <cadence/symbolic/Vector.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cadence {

class ReferenceFrame;
class TimeDerivative;

class Point {
  public:
    explicit Point(std::string name) : name_(std::move(name)) {}

    Point(const Point &) = delete;
    Point &operator=(const Point &) = delete;

    [[nodiscard]] const std::string &Name() const { return name_; }

    /**
     * @brief Locate this point at @p position relative to @p other
     * @throws StructuralError if the points are already related (closed loop)
     */
    void SetPos(Point &other, const Vector &position);

    /**
     * @brief Position of this point relative to @p other
     * @throws NotReadyError if the points are not related
     */
    [[nodiscard]] Vector PosFrom(const Point &other) const;

    /// Set the velocity of this point as seen from @p frame
    void SetVel(const ReferenceFrame &frame, const Vector &velocity);

    /**
     * @brief Velocity of this point in @p frame
     *
     * Uses an explicitly set velocity when present. Otherwise the nearest
     * related point with a velocity in @p frame is the anchor, and the result
     * is the anchor's velocity plus the derivative of the position from it.
     * The anchor may sit anywhere in the tree, including below the root.
     *
     * @throws NotReadyError if no velocity can be derived
     */
    [[nodiscard]] Vector Vel(const ReferenceFrame &frame, const TimeDerivative &derivatives) const;

    [[nodiscard]] bool IsRelatedTo(const Point &other) const;
    [[nodiscard]] const Point &Root() const;

  private:
    struct Edge {
        Point *parent = nullptr;
        Vector offset; ///< Position of this point from the parent
    };

    void MakeRoot();

    /// Position relative to a point on this point's parent chain
    [[nodiscard]] Vector PosFromAncestor(const Point &ancestor) const;

    std::string name_;
    std::optional<Edge> edge_;
    std::vector<Point *> linked_; ///< Neighbours in the tree, regardless of edge direction
    std::vector<std::pair<const ReferenceFrame *, Vector>> velocities_;
};

} // namespace cadence
