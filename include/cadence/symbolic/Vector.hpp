#pragma once

/**
 * @file Vector.hpp
 * @brief Frame-aware 3-D vectors
 *
 * A Vector is a sum of terms, each a 3x1 component column attached to the
 * frame it is expressed in. Terms in different frames are only combined when
 * the vector is expressed in a concrete frame, so vectors can be built before
 * the frames involved are oriented relative to each other.
 */

#include <cadence/core/CoreTypes.hpp>

#include <utility>
#include <vector>

namespace cadence {

class ReferenceFrame;
class TimeDerivative;

class Vector {
  public:
    /// Zero vector
    Vector() = default;

    /// Vector with @p components (3x1) expressed in @p frame
    Vector(const ReferenceFrame &frame, const SymbolicScalar &components);

    [[nodiscard]] bool IsZero() const { return terms_.empty(); }

    /**
     * @brief Components (3x1) in @p frame
     * @throws NotReadyError if a term's frame is not connected to @p frame
     */
    [[nodiscard]] SymbolicScalar Express(const ReferenceFrame &frame) const;

    [[nodiscard]] SymbolicScalar Dot(const Vector &other) const;
    [[nodiscard]] Vector Cross(const Vector &other) const;

    /// Euclidean norm
    [[nodiscard]] SymbolicScalar Magnitude() const;

    /// Time derivative as seen from @p frame
    [[nodiscard]] Vector Dt(const ReferenceFrame &frame, const TimeDerivative &derivatives) const;

    /// Apply a substitution to every component
    template <typename F> [[nodiscard]] Vector Map(F &&fn) const {
        Vector result;
        for (const auto &[frame, components] : terms_) {
            result.terms_.emplace_back(frame, fn(components));
        }
        return result;
    }

    Vector operator+(const Vector &other) const;
    Vector operator-(const Vector &other) const;
    Vector operator-() const;
    Vector operator*(const SymbolicScalar &scalar) const;
    Vector &operator+=(const Vector &other);

    friend Vector operator*(const SymbolicScalar &scalar, const Vector &v) { return v * scalar; }

    [[nodiscard]] const std::vector<std::pair<const ReferenceFrame *, SymbolicScalar>> &
    Terms() const {
        return terms_;
    }

  private:
    /// Frame used when combining with another vector
    [[nodiscard]] const ReferenceFrame *AnyFrame(const Vector &other) const;

    std::vector<std::pair<const ReferenceFrame *, SymbolicScalar>> terms_;
};

} // namespace cadence
