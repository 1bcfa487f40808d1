/**
 * @file yaml_model_demo.cpp
 * @brief Configuration-Driven Model Demo
 *
 * Demonstrates building a model tree from YAML:
 * - ModelLoader::LoadModel() parses the description and resolves types
 *   through the ModelFactory
 * - DefineAll() runs the staged definition
 * - SymbolDictionary exports the generated symbols for parametrization
 *
 * Usage: ./yaml_model_demo [config_path] [symbols_output]
 *        Default: config/rolling_disc.yaml, rolling_disc_symbols.yaml
 */

#include <cadence/cadence.hpp>

#include <Registration.hpp>

#include <filesystem>
#include <iostream>

using namespace cadence;
namespace fs = std::filesystem;

int main(int argc, char *argv[]) {
    std::string config_path = "config/rolling_disc.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }
    std::string symbols_path = "rolling_disc_symbols.yaml";
    if (argc > 2) {
        symbols_path = argv[2];
    }

    if (!fs::exists(config_path)) {
        std::cerr << "❌ Config not found: " << config_path << "\n";
        std::cerr << "   Run from the examples directory or specify path as argument.\n";
        return 1;
    }

    models::RegisterModels();
    GetLogService().SetMinLevel(LogLevel::Debug);
    GetLogService().AddSink(MakeConsoleSink());

    std::cout << "Loading: " << config_path << "\n";

    std::unique_ptr<ModelBase> model;
    try {
        model = io::ModelLoader::LoadModel(config_path);
        model->DefineAll();
    } catch (const Error &e) {
        std::cerr << "❌ Error: " << e.what() << "\n";
        return 1;
    }

    Console console;
    ModelTreeReport report(console);
    report.PrintTree(*model);

    auto dict = SymbolDictionary::Build(*model->Registry(), model.get());
    std::cout << "\n" << report.FormatSymbols(dict) << "\n";

    try {
        dict.ToYAML(symbols_path);
        std::cout << "Symbols written to " << symbols_path << "\n";

        AggregatedSystem system = Aggregate(*model);
        EquationsOfMotion eom = KanesMethodSolver().Solve(system);
        std::cout << "Equations of motion: " << eom.NumIndependentSpeeds()
                  << " independent speeds, " << system.Bodies().size() << " bodies\n";
    } catch (const Error &e) {
        std::cerr << "❌ Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n✅ YAML model demo complete!\n";
    return 0;
}
