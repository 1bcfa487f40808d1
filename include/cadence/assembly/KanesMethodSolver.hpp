#pragma once

/**
 * @file KanesMethodSolver.hpp
 * @brief Kane's method over the CasADi MX algebra
 *
 * Steps:
 * 1. Solve the kinematic differential equations (linear in q') for q'.
 * 2. Differentiate holonomic constraints, add nonholonomic ones and solve
 *    the resulting velocity constraints for the dependent speeds.
 * 3. Form partial velocities with respect to the independent speeds and the
 *    generalized active (Fr) and inertia (Fr*) forces.
 * 4. Fr + Fr* = 0 is linear in u_ind': M = -dFr* / du_ind', F = Fr + Fr*|u'=0.
 */

#include <cadence/assembly/EquationsSolver.hpp>

namespace cadence {

class KanesMethodSolver : public EquationsSolver {
  public:
    [[nodiscard]] EquationsOfMotion Solve(const AggregatedSystem &system) const override;

    [[nodiscard]] std::string Name() const override { return "KanesMethod"; }
};

} // namespace cadence
