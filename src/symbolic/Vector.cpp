/**
 * @file Vector.cpp
 * @brief Frame-aware vector arithmetic
 */

#include <cadence/symbolic/Vector.hpp>

#include <cadence/core/Error.hpp>
#include <cadence/symbolic/Algebra.hpp>
#include <cadence/symbolic/ReferenceFrame.hpp>
#include <cadence/symbolic/Symbol.hpp>

namespace cadence {

Vector::Vector(const ReferenceFrame &frame, const SymbolicScalar &components) {
    if (components.size1() != 3 || components.size2() != 1) {
        throw DefinitionError("vector in frame '" + frame.Name() + "' needs 3x1 components");
    }
    terms_.emplace_back(&frame, components);
}

SymbolicScalar Vector::Express(const ReferenceFrame &frame) const {
    SymbolicScalar result = algebra::Zeros(3);
    for (const auto &[term_frame, components] : terms_) {
        if (term_frame == &frame) {
            result = result + components;
        } else {
            result = result + algebra::Mul(frame.Dcm(*term_frame), components);
        }
    }
    return result;
}

const ReferenceFrame *Vector::AnyFrame(const Vector &other) const {
    if (!terms_.empty()) {
        return terms_.front().first;
    }
    if (!other.terms_.empty()) {
        return other.terms_.front().first;
    }
    return nullptr;
}

SymbolicScalar Vector::Dot(const Vector &other) const {
    const ReferenceFrame *frame = AnyFrame(other);
    if (frame == nullptr || IsZero() || other.IsZero()) {
        return SymbolicScalar(0.0);
    }
    return algebra::Dot(Express(*frame), other.Express(*frame));
}

Vector Vector::Cross(const Vector &other) const {
    if (IsZero() || other.IsZero()) {
        return Vector();
    }
    const ReferenceFrame *frame = AnyFrame(other);
    return Vector(*frame, algebra::Cross(Express(*frame), other.Express(*frame)));
}

SymbolicScalar Vector::Magnitude() const { return sqrt(Dot(*this)); }

Vector Vector::Dt(const ReferenceFrame &frame, const TimeDerivative &derivatives) const {
    if (IsZero()) {
        return Vector();
    }
    return Vector(frame, derivatives.Dt(Express(frame)));
}

Vector Vector::operator+(const Vector &other) const {
    Vector result = *this;
    result += other;
    return result;
}

Vector Vector::operator-(const Vector &other) const { return *this + (-other); }

Vector Vector::operator-() const {
    return Map([](const SymbolicScalar &c) { return -c; });
}

Vector Vector::operator*(const SymbolicScalar &scalar) const {
    return Map([&scalar](const SymbolicScalar &c) { return scalar * c; });
}

Vector &Vector::operator+=(const Vector &other) {
    for (const auto &[frame, components] : other.terms_) {
        bool merged = false;
        for (auto &term : terms_) {
            if (term.first == frame) {
                term.second = term.second + components;
                merged = true;
                break;
            }
        }
        if (!merged) {
            terms_.emplace_back(frame, components);
        }
    }
    return *this;
}

} // namespace cadence
