/**
 * @file Algebra.cpp
 * @brief CasADi MX implementation of the algebra surface
 */

#include <cadence/symbolic/Algebra.hpp>

#include <casadi/casadi.hpp>
#include <janus/math/AutoDiff.hpp>

#include <random>

namespace cadence::algebra {

SymbolicScalar NewSymbol(const std::string &name) { return janus::sym(name); }

SymbolicScalar Stack(const std::vector<SymbolicScalar> &items) {
    if (items.empty()) {
        return SymbolicScalar(0, 1);
    }
    return SymbolicScalar::vertcat(items);
}

std::vector<SymbolicScalar> Unstack(const SymbolicScalar &column) {
    std::vector<SymbolicScalar> entries;
    entries.reserve(static_cast<std::size_t>(column.size1()));
    for (casadi_int i = 0; i < column.size1(); ++i) {
        entries.push_back(column(i, 0));
    }
    return entries;
}

SymbolicScalar Column3(const SymbolicScalar &x, const SymbolicScalar &y, const SymbolicScalar &z) {
    return SymbolicScalar::vertcat({x, y, z});
}

SymbolicScalar Column3(const std::array<double, 3> &values) {
    return SymbolicScalar(casadi::DM(std::vector<double>{values[0], values[1], values[2]}));
}

SymbolicScalar Zeros(int rows, int cols) { return SymbolicScalar::zeros(rows, cols); }

SymbolicScalar Identity(int n) { return SymbolicScalar::eye(n); }

SymbolicScalar Mul(const SymbolicScalar &a, const SymbolicScalar &b) {
    return SymbolicScalar::mtimes(a, b);
}

SymbolicScalar Transpose(const SymbolicScalar &a) { return a.T(); }

SymbolicScalar Dot(const SymbolicScalar &a, const SymbolicScalar &b) {
    return SymbolicScalar::dot(a, b);
}

SymbolicScalar Cross(const SymbolicScalar &a, const SymbolicScalar &b) {
    return Column3(a(1, 0) * b(2, 0) - a(2, 0) * b(1, 0), a(2, 0) * b(0, 0) - a(0, 0) * b(2, 0),
                   a(0, 0) * b(1, 0) - a(1, 0) * b(0, 0));
}

SymbolicScalar Skew(const SymbolicScalar &a) {
    SymbolicScalar zero(0.0);
    return SymbolicScalar::vertcat({SymbolicScalar::horzcat({zero, -a(2, 0), a(1, 0)}),
                                    SymbolicScalar::horzcat({a(2, 0), zero, -a(0, 0)}),
                                    SymbolicScalar::horzcat({-a(1, 0), a(0, 0), zero})});
}

SymbolicScalar Vee(const SymbolicScalar &m) {
    return Column3(0.5 * (m(2, 1) - m(1, 2)), 0.5 * (m(0, 2) - m(2, 0)),
                   0.5 * (m(1, 0) - m(0, 1)));
}

SymbolicScalar AxisRotation(const std::array<double, 3> &axis, const SymbolicScalar &angle) {
    SymbolicScalar a = Column3(axis);
    SymbolicScalar c = cos(angle);
    SymbolicScalar s = sin(angle);
    return c * Identity(3) + s * Skew(a) + (1.0 - c) * Mul(a, Transpose(a));
}

SymbolicScalar Jacobian(const SymbolicScalar &expr, const SymbolicScalar &vars) {
    if (expr.is_empty() || vars.is_empty()) {
        return Zeros(static_cast<int>(expr.numel()), static_cast<int>(vars.numel()));
    }
    return janus::jacobian({expr}, {vars});
}

SymbolicScalar Substitute(const SymbolicScalar &expr, const std::vector<SymbolicScalar> &symbols,
                          const std::vector<SymbolicScalar> &values) {
    if (symbols.empty() || expr.is_empty()) {
        return expr;
    }
    return SymbolicScalar::substitute(std::vector<SymbolicScalar>{expr}, symbols, values).at(0);
}

SymbolicScalar SubstituteZero(const SymbolicScalar &expr,
                              const std::vector<SymbolicScalar> &symbols) {
    std::vector<SymbolicScalar> zeros(symbols.size(), SymbolicScalar(0.0));
    return Substitute(expr, symbols, zeros);
}

SymbolicScalar Solve(const SymbolicScalar &a, const SymbolicScalar &b) {
    if (b.is_empty()) {
        return b;
    }
    return SymbolicScalar::solve(a, b);
}

int StructuralRank(const SymbolicScalar &a) {
    if (a.is_empty()) {
        return 0;
    }
    return static_cast<int>(sprank(a));
}

bool DependsOn(const SymbolicScalar &expr, const SymbolicScalar &var) {
    if (expr.is_empty()) {
        return false;
    }
    return SymbolicScalar::depends_on(expr, var);
}

bool IsSameSymbol(const SymbolicScalar &a, const SymbolicScalar &b) {
    return SymbolicScalar::is_equal(a, b, 0);
}

bool IsZeroAt(const SymbolicScalar &expr, int samples, double tolerance) {
    if (expr.is_empty()) {
        return true;
    }
    std::vector<SymbolicScalar> free = SymbolicScalar::symvar(expr);
    casadi::Function check("is_zero_check", free, {expr});

    std::mt19937 rng(42);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    for (int s = 0; s < samples; ++s) {
        std::vector<casadi::DM> args;
        args.reserve(free.size());
        for (const auto &symbol : free) {
            std::vector<double> values(static_cast<std::size_t>(symbol.numel()));
            for (auto &v : values) {
                v = dist(rng);
            }
            args.push_back(casadi::DM::reshape(casadi::DM(values), symbol.size1(), symbol.size2()));
        }
        std::vector<casadi::DM> result = check(args);
        if (static_cast<double>(casadi::DM::norm_inf(result.at(0))) > tolerance) {
            return false;
        }
    }
    return true;
}

} // namespace cadence::algebra
