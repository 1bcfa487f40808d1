#pragma once

/**
 * @file Algebra.hpp
 * @brief Fixed surface over the CasADi MX algebra engine
 *
 * Every expression manipulation the composition engine performs goes through
 * these functions: symbol creation, stacking, Jacobians, substitution,
 * linear solves and the small amount of 3-D geometry (cross products,
 * rotation matrices) the mechanics layer needs.
 */

#include <cadence/core/CoreTypes.hpp>

#include <array>
#include <string>
#include <vector>

namespace cadence::algebra {

/// Create a new scalar symbol
SymbolicScalar NewSymbol(const std::string &name);

/// Stack scalars (or column blocks) into one column; empty input gives a 0x1 column
SymbolicScalar Stack(const std::vector<SymbolicScalar> &items);

/// Split a column into its scalar entries
std::vector<SymbolicScalar> Unstack(const SymbolicScalar &column);

/// 3x1 column from three scalar expressions
SymbolicScalar Column3(const SymbolicScalar &x, const SymbolicScalar &y, const SymbolicScalar &z);

/// Constant 3x1 column
SymbolicScalar Column3(const std::array<double, 3> &values);

SymbolicScalar Zeros(int rows, int cols = 1);
SymbolicScalar Identity(int n);

/// Matrix product
SymbolicScalar Mul(const SymbolicScalar &a, const SymbolicScalar &b);

SymbolicScalar Transpose(const SymbolicScalar &a);

/// Inner product of two columns
SymbolicScalar Dot(const SymbolicScalar &a, const SymbolicScalar &b);

/// Cross product of two 3x1 columns
SymbolicScalar Cross(const SymbolicScalar &a, const SymbolicScalar &b);

/// Skew-symmetric matrix such that Skew(a) * b == Cross(a, b)
SymbolicScalar Skew(const SymbolicScalar &a);

/// Inverse of Skew() for a (nearly) skew-symmetric 3x3 matrix
SymbolicScalar Vee(const SymbolicScalar &m);

/**
 * @brief Rotation matrix for a rotation of @p angle about a unit @p axis
 *
 * Returns parent_R_child for a child frame obtained by rotating the parent
 * about the axis (Rodrigues' formula).
 */
SymbolicScalar AxisRotation(const std::array<double, 3> &axis, const SymbolicScalar &angle);

/**
 * @brief Jacobian d(expr)/d(vars) of a column with respect to a column of symbols
 *
 * Handles empty operands by returning a correctly sized zero matrix.
 */
SymbolicScalar Jacobian(const SymbolicScalar &expr, const SymbolicScalar &vars);

/**
 * @brief Replace symbols by expressions
 *
 * @param expr Expression to rewrite
 * @param symbols Pure symbols to replace
 * @param values Replacement expressions (same length as @p symbols)
 */
SymbolicScalar Substitute(const SymbolicScalar &expr, const std::vector<SymbolicScalar> &symbols,
                          const std::vector<SymbolicScalar> &values);

/// Replace every symbol in @p symbols by zero
SymbolicScalar SubstituteZero(const SymbolicScalar &expr,
                              const std::vector<SymbolicScalar> &symbols);

/// Solve the linear system A x = b
SymbolicScalar Solve(const SymbolicScalar &a, const SymbolicScalar &b);

/// Structural rank of the sparsity pattern of @p a
int StructuralRank(const SymbolicScalar &a);

/// Whether @p expr depends on symbol @p var
bool DependsOn(const SymbolicScalar &expr, const SymbolicScalar &var);

/// Whether two expressions are the same graph node (symbol identity)
bool IsSameSymbol(const SymbolicScalar &a, const SymbolicScalar &b);

/**
 * @brief Numeric zero check at random points
 *
 * Evaluates @p expr with every free symbol drawn uniformly from [-1, 1]
 * (fixed seed) @p samples times and checks the infinity norm stays below
 * @p tolerance. Used where symbolic simplification cannot prove a zero.
 */
bool IsZeroAt(const SymbolicScalar &expr, int samples = 5, double tolerance = 1e-10);

} // namespace cadence::algebra
