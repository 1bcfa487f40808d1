/**
 * @file pendulum_demo.cpp
 * @brief Actuated Pendulum Demo
 *
 * A RigidLink hinged to FlatGround through a RevoluteJoint. The joint is
 * actuated, so its torque T appears as an auxiliary symbol in the
 * parameter vector. The analytic result M = m (l/2)^2 + I_yy and
 * F = -m g (l/2) cos(q) + T is printed next to the derived one.
 *
 * Usage: ./pendulum_demo
 */

#include <cadence/cadence.hpp>

#include <grounds/FlatGround.hpp>
#include <joints/RevoluteJoint.hpp>
#include <links/RigidLink.hpp>
#include <systems/Pendulum.hpp>

#include <vulcan/core/Constants.hpp>

#include <cmath>
#include <iomanip>
#include <iostream>

using namespace cadence;

int main() {
    std::cout << "╔════════════════════════════════════════════════════════════╗\n";
    std::cout << "║       Cadence Actuated Pendulum Demo                       ║\n";
    std::cout << "╚════════════════════════════════════════════════════════════╝\n\n";

    auto pendulum = std::make_unique<models::Pendulum>("pendulum");
    auto &ground = pendulum->AttachSubModel("ground", std::make_unique<models::FlatGround>("ground"));
    auto &link = pendulum->AttachSubModel("link", std::make_unique<models::RigidLink>("link"));

    auto &joint = pendulum->AddConnection(
        "joint", std::make_unique<models::RevoluteJoint>(
                     "joint",
                     std::vector<Interface *>{&ground.GetInterface("surface"),
                                              &link.GetInterface("proximal")},
                     Axis::Y));
    ModelOptions options;
    options.name = "joint";
    options.type = "RevoluteJoint";
    options.booleans["actuated"] = true;
    joint.SetOptions(options);

    EquationsOfMotion eom;
    std::unique_ptr<AggregatedSystem> system;
    try {
        pendulum->DefineAll();
        system = std::make_unique<AggregatedSystem>(Aggregate(*pendulum));
        eom = KanesMethodSolver().Solve(*system);
    } catch (const Error &e) {
        std::cerr << "❌ Error: " << e.what() << "\n";
        return 1;
    }

    Console console;
    ModelTreeReport(console).PrintTree(*pendulum);
    std::cout << "\n";

    // Parameters: constants then auxiliaries
    const double g = vulcan::constants::physics::g0;
    const double l = 1.2;
    const double m = 3.0;
    const double iyy = m * l * l / 12.0;
    const double torque = 5.0;
    const std::map<std::string, double> values = {
        {"pendulum.ground.g", g},      {"pendulum.link.l", l},       {"pendulum.link.m", m},
        {"pendulum.link.ixx", 0.01},   {"pendulum.link.iyy", iyy},   {"pendulum.link.izz", iyy},
        {"pendulum.joint.T[aux]", torque},
    };
    NumericVector p(static_cast<Eigen::Index>(system->Constants().size() +
                                              system->Auxiliaries().size()));
    Eigen::Index k = 0;
    for (const Symbol *s : system->Constants()) {
        p(k++) = values.at(s->identifier);
    }
    for (const Symbol *s : system->Auxiliaries()) {
        p(k++) = values.at(s->identifier);
    }

    janus::Function f = eom.MakeFunction();

    std::cout << "─────────────────────────────────────────────────────────────\n";
    std::cout << std::setw(10) << "q [rad]" << std::setw(14) << "M" << std::setw(14)
              << "M (exact)" << std::setw(14) << "F" << std::setw(14) << "F (exact)" << "\n";
    std::cout << "─────────────────────────────────────────────────────────────\n";

    std::cout << std::fixed << std::setprecision(5);
    for (double angle : {0.0, 0.5, 1.0, 1.5, 2.0}) {
        NumericVector q(1);
        q << angle;
        NumericVector u(1);
        u << 0.0;
        auto res = f(q, u, p);

        const double mass_exact = m * (l / 2.0) * (l / 2.0) + iyy;
        const double forcing_exact = -m * g * (l / 2.0) * std::cos(angle) + torque;
        std::cout << std::setw(10) << angle << std::setw(14) << res[0](0, 0) << std::setw(14)
                  << mass_exact << std::setw(14) << res[1](0, 0) << std::setw(14)
                  << forcing_exact << "\n";
    }
    std::cout << "─────────────────────────────────────────────────────────────\n";

    std::cout << "\n✅ Pendulum demo complete!\n";
    return 0;
}
