/**
 * @file KanesMethodSolver.cpp
 * @brief Equations of motion by Kane's method
 */

#include <cadence/assembly/KanesMethodSolver.hpp>

#include <cadence/core/Error.hpp>
#include <cadence/io/LogService.hpp>
#include <cadence/symbolic/Algebra.hpp>
#include <cadence/symbolic/Point.hpp>
#include <cadence/symbolic/ReferenceFrame.hpp>

namespace cadence {

namespace {

std::vector<SymbolicScalar> Values(const std::vector<const Symbol *> &symbols) {
    std::vector<SymbolicScalar> values;
    values.reserve(symbols.size());
    for (const Symbol *s : symbols) {
        values.push_back(s->value);
    }
    return values;
}

std::vector<SymbolicScalar> Rates(const std::vector<const Symbol *> &symbols) {
    std::vector<SymbolicScalar> rates;
    rates.reserve(symbols.size());
    for (const Symbol *s : symbols) {
        rates.push_back(s->rate);
    }
    return rates;
}

std::vector<SymbolicScalar> Exprs(const std::vector<Equation> &equations) {
    std::vector<SymbolicScalar> exprs;
    exprs.reserve(equations.size());
    for (const auto &eq : equations) {
        exprs.push_back(eq.expr);
    }
    return exprs;
}

/// Rewrites expressions in (q, q', u) into expressions in (q, u_ind)
class Constrainer {
  public:
    Constrainer(std::vector<SymbolicScalar> qd, std::vector<SymbolicScalar> qd_solution,
                std::vector<SymbolicScalar> u_dep, std::vector<SymbolicScalar> u_dep_solution)
        : qd_(std::move(qd)), qd_solution_(std::move(qd_solution)), u_dep_(std::move(u_dep)),
          u_dep_solution_(std::move(u_dep_solution)) {}

    [[nodiscard]] SymbolicScalar operator()(const SymbolicScalar &expr) const {
        SymbolicScalar result = algebra::Substitute(expr, qd_, qd_solution_);
        return algebra::Substitute(result, u_dep_, u_dep_solution_);
    }

  private:
    std::vector<SymbolicScalar> qd_;
    std::vector<SymbolicScalar> qd_solution_;
    std::vector<SymbolicScalar> u_dep_;
    std::vector<SymbolicScalar> u_dep_solution_;
};

} // namespace

EquationsOfMotion KanesMethodSolver::Solve(const AggregatedSystem &system) const {
    const SolverError::Ownership ownership = system.OwnershipTable();
    const auto &coordinates = system.Coordinates();
    const auto &speeds = system.Speeds();

    if (system.InertialFrame() == nullptr) {
        throw SolverError("no inertial frame was declared", ownership);
    }
    const ReferenceFrame &inertial = *system.InertialFrame();
    const TimeDerivative &derivatives = system.Derivatives();

    // -------------------------------------------------------------------------
    // Kinematic differential equations
    // -------------------------------------------------------------------------
    const auto &kdes = system.KinematicEquations();
    if (kdes.size() != coordinates.size()) {
        throw SolverError("expected " + std::to_string(coordinates.size()) +
                              " kinematic differential equations (one per coordinate), got " +
                              std::to_string(kdes.size()),
                          ownership);
    }

    const std::vector<SymbolicScalar> q = Values(coordinates);
    const std::vector<SymbolicScalar> qd = Rates(coordinates);
    const std::vector<SymbolicScalar> u = Values(speeds);

    SymbolicScalar kde = algebra::Stack(Exprs(kdes));
    SymbolicScalar kde_jacobian = algebra::Jacobian(kde, algebra::Stack(qd));
    if (algebra::StructuralRank(kde_jacobian) != static_cast<int>(qd.size())) {
        throw SolverError("kinematic differential equations cannot be solved for every "
                          "coordinate rate (structurally singular in q')",
                          ownership);
    }
    SymbolicScalar qd_solution =
        algebra::Solve(kde_jacobian, -algebra::SubstituteZero(kde, qd));
    const std::vector<SymbolicScalar> qd_solved = algebra::Unstack(qd_solution);

    // -------------------------------------------------------------------------
    // Dependent speeds
    // -------------------------------------------------------------------------
    std::vector<SymbolicScalar> u_dep;
    std::vector<const Symbol *> independent;
    for (const SymbolicScalar &dep : system.DependentSpeeds()) {
        bool is_speed = false;
        for (const Symbol *s : speeds) {
            is_speed = is_speed || algebra::IsSameSymbol(s->value, dep);
        }
        if (!is_speed) {
            throw SolverError("a dependent speed is not a registered generalized speed",
                              ownership);
        }
        u_dep.push_back(dep);
    }
    for (const Symbol *s : speeds) {
        bool dependent = false;
        for (const SymbolicScalar &dep : u_dep) {
            dependent = dependent || algebra::IsSameSymbol(s->value, dep);
        }
        if (!dependent) {
            independent.push_back(s);
        }
    }
    const std::vector<SymbolicScalar> u_ind = Values(independent);
    const std::vector<SymbolicScalar> ud_ind = Rates(independent);

    std::vector<SymbolicScalar> velocity_constraints;
    for (const auto &eq : system.HolonomicConstraints()) {
        SymbolicScalar rate = algebra::Mul(
            algebra::Jacobian(eq.expr, algebra::Stack(q)), algebra::Stack(qd));
        velocity_constraints.push_back(algebra::Substitute(rate, qd, qd_solved));
    }
    for (const auto &eq : system.NonholonomicConstraints()) {
        velocity_constraints.push_back(algebra::Substitute(eq.expr, qd, qd_solved));
    }
    if (velocity_constraints.size() != u_dep.size()) {
        throw SolverError("number of velocity constraints (" +
                              std::to_string(velocity_constraints.size()) +
                              ") does not match the number of dependent speeds (" +
                              std::to_string(u_dep.size()) + ")",
                          ownership);
    }

    SymbolicScalar constraints = algebra::Stack(velocity_constraints);
    std::vector<SymbolicScalar> u_dep_solved;
    SymbolicScalar u_dep_solution = algebra::Stack({});
    if (!u_dep.empty()) {
        SymbolicScalar a_dep = algebra::Jacobian(constraints, algebra::Stack(u_dep));
        if (algebra::StructuralRank(a_dep) != static_cast<int>(u_dep.size())) {
            throw SolverError("velocity constraints cannot be solved for the dependent "
                              "speeds (structurally singular in the dependent speeds)",
                              ownership);
        }
        u_dep_solution = algebra::Solve(a_dep, -algebra::SubstituteZero(constraints, u_dep));
        u_dep_solved = algebra::Unstack(u_dep_solution);
    }

    const Constrainer constrain(qd, qd_solved, u_dep, u_dep_solved);

    // Time derivative of constrained expressions: q' from the KDEs, u_ind' free
    TimeDerivative constrained;
    const SymbolicScalar qd_constrained = constrain(qd_solution);
    const std::vector<SymbolicScalar> qd_constrained_list = algebra::Unstack(qd_constrained);
    for (std::size_t i = 0; i < q.size(); ++i) {
        constrained.Add(q[i], qd_constrained_list[i]);
    }
    for (std::size_t i = 0; i < u_ind.size(); ++i) {
        constrained.Add(u_ind[i], ud_ind[i]);
    }

    // -------------------------------------------------------------------------
    // Generalized active and inertia forces
    // -------------------------------------------------------------------------
    const auto n_ind = static_cast<int>(u_ind.size());
    const SymbolicScalar u_ind_column = algebra::Stack(u_ind);
    SymbolicScalar fr = algebra::Zeros(n_ind);
    SymbolicScalar fr_star = algebra::Zeros(n_ind);

    try {
        for (const RigidBody *body : system.Bodies()) {
            SymbolicScalar v =
                constrain(body->masscenter->Vel(inertial, derivatives).Express(inertial));
            SymbolicScalar w =
                constrain(body->frame->AngVel(inertial, derivatives).Express(inertial));
            SymbolicScalar v_partial = algebra::Jacobian(v, u_ind_column);
            SymbolicScalar w_partial = algebra::Jacobian(w, u_ind_column);
            SymbolicScalar a = constrained.Dt(v);
            SymbolicScalar alpha = constrained.Dt(w);

            SymbolicScalar n_r_b = inertial.Dcm(*body->frame);
            SymbolicScalar inertia =
                algebra::Mul(algebra::Mul(n_r_b, body->inertia), algebra::Transpose(n_r_b));

            SymbolicScalar r_star = -(body->mass * a);
            SymbolicScalar t_star = -(algebra::Mul(inertia, alpha) +
                                      algebra::Cross(w, algebra::Mul(inertia, w)));
            fr_star = fr_star + algebra::Mul(algebra::Transpose(v_partial), r_star) +
                      algebra::Mul(algebra::Transpose(w_partial), t_star);
        }

        for (const Load &load : system.Loads()) {
            SymbolicScalar vector = constrain(load.vector.Express(inertial));
            SymbolicScalar velocity =
                load.kind == LoadKind::Force
                    ? constrain(load.point->Vel(inertial, derivatives).Express(inertial))
                    : constrain(load.frame->AngVel(inertial, derivatives).Express(inertial));
            SymbolicScalar partial = algebra::Jacobian(velocity, u_ind_column);
            fr = fr + algebra::Mul(algebra::Transpose(partial), vector);
        }
    } catch (const NotReadyError &e) {
        throw SolverError(std::string("kinematics incomplete: ") + e.message(), ownership);
    }

    const SymbolicScalar ud_column = algebra::Stack(ud_ind);

    EquationsOfMotion eom;
    eom.mass_matrix = -algebra::Jacobian(fr_star, ud_column);
    eom.forcing = fr + algebra::SubstituteZero(fr_star, ud_ind);
    eom.coordinates = algebra::Stack(q);
    eom.speeds = algebra::Stack(u);
    eom.independent_speeds = u_ind_column;
    eom.dependent_speeds = algebra::Stack(u_dep);
    eom.parameters = algebra::Stack(Values(system.Constants()));
    if (!system.Auxiliaries().empty()) {
        eom.parameters = SymbolicScalar::vertcat(
            {eom.parameters, algebra::Stack(Values(system.Auxiliaries()))});
    }
    eom.kinematic_rates = qd_constrained;
    eom.dependent_solution = u_dep_solution;
    eom.velocity_constraints = constraints;

    CADENCE_LOG_DEBUG(Name() + ": " + std::to_string(q.size()) + " coordinates, " +
                      std::to_string(u_ind.size()) + " independent and " +
                      std::to_string(u_dep.size()) + " dependent speeds");
    return eom;
}

} // namespace cadence
