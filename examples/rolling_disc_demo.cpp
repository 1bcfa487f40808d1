/**
 * @file rolling_disc_demo.cpp
 * @brief Rolling Disc Demo
 *
 * Composes a rolling disc from the model library:
 * - KnifeEdgeWheel as the disc, FlatGround as the surface
 * - NonHolonomicTyre created automatically to enforce pure rolling
 * - Kane's method derives M(q, p) u' = F(q, u, p) for the 3 independent speeds
 *
 * The symbolic equations are then evaluated numerically at a leaning,
 * spinning configuration.
 *
 * Usage: ./rolling_disc_demo
 */

#include <cadence/cadence.hpp>

#include <grounds/FlatGround.hpp>
#include <systems/RollingDisc.hpp>
#include <wheels/KnifeEdgeWheel.hpp>

#include <vulcan/core/Constants.hpp>

#include <iomanip>
#include <iostream>
#include <map>

using namespace cadence;

int main() {
    std::cout << "╔════════════════════════════════════════════════════════════╗\n";
    std::cout << "║       Cadence Rolling Disc Demo                            ║\n";
    std::cout << "║       KnifeEdgeWheel + FlatGround + NonHolonomicTyre       ║\n";
    std::cout << "╚════════════════════════════════════════════════════════════╝\n\n";

    GetLogService().AddSink(MakeConsoleSink());

    // =========================================================================
    // Compose and define
    // =========================================================================

    auto rolling_disc = std::make_unique<models::RollingDisc>("rolling_disc");
    rolling_disc->AttachSubModel("disc", std::make_unique<models::KnifeEdgeWheel>("disc"));
    rolling_disc->AttachSubModel("ground", std::make_unique<models::FlatGround>("ground"));

    try {
        rolling_disc->DefineAll();
    } catch (const Error &e) {
        std::cerr << "❌ Error: " << e.what() << "\n";
        return 1;
    }

    Console console;
    ModelTreeReport report(console);
    report.PrintTree(*rolling_disc);
    std::cout << "\n"
              << report.FormatSymbols(
                     SymbolDictionary::Build(*rolling_disc->Registry(), rolling_disc.get()))
              << "\n";

    // =========================================================================
    // Equations of motion
    // =========================================================================

    AggregatedSystem system = Aggregate(*rolling_disc);
    EquationsOfMotion eom;
    try {
        eom = KanesMethodSolver().Solve(system);
    } catch (const SolverError &e) {
        std::cerr << "❌ Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "  Coordinates:        " << system.Coordinates().size() << "\n";
    std::cout << "  Speeds:             " << system.Speeds().size() << "\n";
    std::cout << "  Independent speeds: " << eom.NumIndependentSpeeds() << "\n";
    std::cout << "  Constraints:        " << system.NonholonomicConstraints().size() << "\n\n";

    // =========================================================================
    // Numeric evaluation
    // =========================================================================

    const double m = 2.0;
    const double r = 0.3;
    const std::map<std::string, double> values = {
        {"rolling_disc.disc.r", r},
        {"rolling_disc.disc.m", m},
        {"rolling_disc.disc.ixx", m * r * r / 4.0},
        {"rolling_disc.disc.iyy", m * r * r / 2.0},
        {"rolling_disc.ground.g", vulcan::constants::physics::g0},
    };

    NumericVector p(static_cast<Eigen::Index>(system.Constants().size()));
    for (std::size_t i = 0; i < system.Constants().size(); ++i) {
        p(static_cast<Eigen::Index>(i)) = values.at(system.Constants()[i]->identifier);
    }

    NumericVector q(5);
    q << 0.0, 0.0, 0.0, 0.2, 0.0; // leaning 0.2 rad
    NumericVector u_ind(3);
    u_ind << 0.0, 0.0, 6.0; // spinning

    janus::Function dependent("dependent", {eom.coordinates, eom.independent_speeds, eom.parameters},
                              {eom.dependent_solution});
    auto u_dep = dependent(q, u_ind, p)[0];

    NumericVector u(5);
    u << u_dep(0, 0), u_dep(1, 0), u_ind(0), u_ind(1), u_ind(2);

    auto res = eom.MakeFunction()(q, u, p);
    auto residual = eom.MakeResidualFunction()(q, u, p)[0];

    std::cout << std::fixed << std::setprecision(6);
    std::cout << "  Speeds u:  [";
    for (Eigen::Index i = 0; i < u.size(); ++i) {
        std::cout << (i > 0 ? ", " : "") << u(i);
    }
    std::cout << "]\n";
    std::cout << "  Mass matrix:\n";
    for (Eigen::Index i = 0; i < res[0].rows(); ++i) {
        std::cout << "    ";
        for (Eigen::Index j = 0; j < res[0].cols(); ++j) {
            std::cout << std::setw(12) << res[0](i, j);
        }
        std::cout << "\n";
    }
    std::cout << "  Forcing:   [";
    for (Eigen::Index i = 0; i < res[1].rows(); ++i) {
        std::cout << (i > 0 ? ", " : "") << res[1](i, 0);
    }
    std::cout << "]\n";
    std::cout << "  No-slip residual: [" << residual(0, 0) << ", " << residual(1, 0) << "]\n";

    std::cout << "\n✅ Rolling disc demo complete!\n";
    return 0;
}
