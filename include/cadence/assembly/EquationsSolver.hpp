#pragma once

/**
 * @file EquationsSolver.hpp
 * @brief Solver bridge from an aggregated system to equations of motion
 */

#include <cadence/assembly/AggregatedSystem.hpp>
#include <cadence/core/CoreTypes.hpp>

#include <janus/core/Function.hpp>

#include <string>
#include <vector>

namespace cadence {

/**
 * @brief Equations of motion M(q, p) u_ind' = F(q, u, p)
 *
 * All columns are CasADi MX. `parameters` stacks the constants followed by
 * the auxiliary (specified) quantities, in registry order.
 */
struct EquationsOfMotion {
    SymbolicScalar mass_matrix; ///< n_ind x n_ind
    SymbolicScalar forcing;     ///< n_ind x 1

    SymbolicScalar coordinates;         ///< q
    SymbolicScalar speeds;              ///< u (all speeds)
    SymbolicScalar independent_speeds;  ///< u_ind
    SymbolicScalar dependent_speeds;    ///< u_dep
    SymbolicScalar parameters;          ///< p
    SymbolicScalar kinematic_rates;     ///< q' in terms of (q, u_ind, p)
    SymbolicScalar dependent_solution;  ///< u_dep in terms of (q, u_ind, p)
    SymbolicScalar velocity_constraints; ///< Residual in terms of (q, u, p)

    [[nodiscard]] std::size_t NumIndependentSpeeds() const {
        return static_cast<std::size_t>(independent_speeds.size1());
    }

    /// Velocity constraint residuals (zero for consistent speeds)
    [[nodiscard]] const SymbolicScalar &NonholonomicResidual() const {
        return velocity_constraints;
    }

    /// Numeric form (q, u, p) -> (M, F)
    [[nodiscard]] janus::Function MakeFunction(const std::string &name = "eom") const {
        return janus::Function(name, {coordinates, speeds, parameters},
                               {mass_matrix, forcing});
    }

    /// Numeric form (q, u, p) -> velocity constraint residual
    [[nodiscard]] janus::Function MakeResidualFunction(const std::string &name = "residual") const {
        return janus::Function(name, {coordinates, speeds, parameters}, {velocity_constraints});
    }
};

/**
 * @brief Abstract equations-of-motion derivation
 */
class EquationsSolver {
  public:
    virtual ~EquationsSolver() = default;

    /// @throws SolverError if the system is inconsistent
    [[nodiscard]] virtual EquationsOfMotion Solve(const AggregatedSystem &system) const = 0;

    [[nodiscard]] virtual std::string Name() const = 0;
};

} // namespace cadence
